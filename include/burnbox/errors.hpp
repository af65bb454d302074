#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace burnbox {

enum class Fault : std::uint8_t {
    size_limit_exceeded = 1,
    quota_exceeded = 2,
    not_found = 3,
    expired = 4,
    wrong_password = 5,
    corrupt_payload = 6,
    storage_unavailable = 7,
    canceled = 8
};

const char* fault_name(Fault fault);

class TransferError : public std::runtime_error {
public:
    explicit TransferError(Fault fault);
    TransferError(Fault fault, const std::string& detail);

    Fault fault() const noexcept;

private:
    Fault fault_;
};

}
