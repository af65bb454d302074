#pragma once

#include "burnbox/blob_store.hpp"
#include "burnbox/cipher_rig.hpp"
#include "burnbox/key_wrap.hpp"
#include "burnbox/tier_policy.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace burnbox {

enum class Kind : std::uint8_t {
    text = 1,
    file = 2
};

enum class State : std::uint8_t {
    active = 1,
    consumed = 2,
    expired = 3,
    deleted = 4
};

std::string_view kind_name(Kind kind);
std::string_view state_name(State state);

struct TransferRecord {
    std::string id;
    std::string owner;
    Kind kind = Kind::text;
    Tier tier = Tier::free;
    State state = State::active;
    Packet packet;
    KeyHandle key;
    std::optional<BlobRecord> blob;
    std::string file_name;
    std::uint64_t size = 0;
    std::uint64_t created_at = 0;
    std::uint64_t expires_at = 0;
    std::uint32_t failed_attempts = 0;
    // claimed by a retrieval still in progress
    bool in_flight = false;

    bool due(std::uint64_t now) const;
    void wipe();
};

}
