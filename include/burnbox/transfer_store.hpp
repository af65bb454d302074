#pragma once

#include "burnbox/transfer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace burnbox {

// Called with the registry lock held.
class TransferStore {
public:
    virtual ~TransferStore() = default;

    virtual bool insert(TransferRecord rec) = 0;
    virtual TransferRecord* find(const std::string& id) = 0;
    virtual bool erase(const std::string& id) = 0;
    virtual std::vector<std::string> sweepable(std::uint64_t now) const = 0;
    virtual std::vector<std::string> ids() const = 0;
    virtual std::size_t size() const = 0;
};

class MemoryTransferStore : public TransferStore {
public:
    MemoryTransferStore() = default;
    MemoryTransferStore(const MemoryTransferStore&) = delete;
    MemoryTransferStore& operator=(const MemoryTransferStore&) = delete;
    ~MemoryTransferStore() override;

    bool insert(TransferRecord rec) override;
    TransferRecord* find(const std::string& id) override;
    bool erase(const std::string& id) override;
    std::vector<std::string> sweepable(std::uint64_t now) const override;
    std::vector<std::string> ids() const override;
    std::size_t size() const override;

private:
    std::unordered_map<std::string, TransferRecord> slots_;
};

}
