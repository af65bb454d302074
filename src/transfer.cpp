#include "burnbox/transfer.hpp"

namespace burnbox {

std::string_view kind_name(Kind kind) {
    switch (kind) {
    case Kind::text:
        return "text";
    case Kind::file:
        return "file";
    }
    return "unknown";
}

std::string_view state_name(State state) {
    switch (state) {
    case State::active:
        return "active";
    case State::consumed:
        return "consumed";
    case State::expired:
        return "expired";
    case State::deleted:
        return "deleted";
    }
    return "unknown";
}

bool TransferRecord::due(std::uint64_t now) const {
    return now >= expires_at;
}

void TransferRecord::wipe() {
    zero(packet.body);
    packet.body.clear();
    zero(packet.nonce);
    zero(packet.mac);
    key.wipe();
}

}
