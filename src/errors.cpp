#include "burnbox/errors.hpp"

namespace burnbox {

const char* fault_name(Fault fault) {
    switch (fault) {
    case Fault::size_limit_exceeded:
        return "size limit exceeded";
    case Fault::quota_exceeded:
        return "quota exceeded";
    case Fault::not_found:
        return "not found";
    case Fault::expired:
        return "expired";
    case Fault::wrong_password:
        return "wrong password";
    case Fault::corrupt_payload:
        return "corrupt payload";
    case Fault::storage_unavailable:
        return "storage unavailable";
    case Fault::canceled:
        return "canceled";
    }
    return "unknown fault";
}

TransferError::TransferError(Fault fault) : std::runtime_error(fault_name(fault)), fault_(fault) {}

TransferError::TransferError(Fault fault, const std::string& detail)
    : std::runtime_error(std::string(fault_name(fault)) + ": " + detail), fault_(fault) {}

Fault TransferError::fault() const noexcept {
    return fault_;
}

}
