#pragma once

#include "burnbox/tier_policy.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace burnbox {

struct BlobRecord {
    std::string transfer_id;
    std::string ref;
    std::uint64_t size = 0;
    bool purged = false;
};

class BlobStore {
public:
    explicit BlobStore(const TierPolicy& policy);
    virtual ~BlobStore() = default;
    BlobStore(const BlobStore&) = delete;
    BlobStore& operator=(const BlobStore&) = delete;

    BlobRecord stage(const std::string& transfer_id, std::istream& in, std::uint64_t size, Tier tier, std::stop_token stop = {});
    std::unique_ptr<std::istream> fetch(const BlobRecord& rec);
    void purge(BlobRecord& rec);
    std::size_t reclaim(const std::unordered_set<std::string>& keep);

    virtual std::size_t count() const = 0;

protected:
    static constexpr std::size_t chunk_len = 64 * 1024;

    template <typename Sink>
    static void pump(std::istream& in, std::uint64_t size, std::stop_token stop, Sink&& sink);

private:
    virtual void put(const std::string& ref, std::istream& in, std::uint64_t size, std::stop_token stop) = 0;
    virtual std::unique_ptr<std::istream> get(const std::string& ref) = 0;
    virtual void drop(const std::string& ref) = 0;
    virtual std::vector<std::string> leftovers() const = 0;

    const TierPolicy& policy_;
};

class DiskBlobStore : public BlobStore {
public:
    DiskBlobStore(std::filesystem::path dir, const TierPolicy& policy);

    std::size_t count() const override;
    const std::filesystem::path& dir() const;

private:
    void put(const std::string& ref, std::istream& in, std::uint64_t size, std::stop_token stop) override;
    std::unique_ptr<std::istream> get(const std::string& ref) override;
    void drop(const std::string& ref) override;
    std::vector<std::string> leftovers() const override;

    std::filesystem::path path_of(const std::string& ref) const;

    std::filesystem::path dir_;
};

class MemoryBlobStore : public BlobStore {
public:
    explicit MemoryBlobStore(const TierPolicy& policy);
    ~MemoryBlobStore() override;

    std::size_t count() const override;

protected:
    void put(const std::string& ref, std::istream& in, std::uint64_t size, std::stop_token stop) override;
    std::unique_ptr<std::istream> get(const std::string& ref) override;
    void drop(const std::string& ref) override;
    std::vector<std::string> leftovers() const override;

private:
    std::unordered_map<std::string, std::vector<std::uint8_t>> slots_;
    mutable std::mutex mu_;
};

}
