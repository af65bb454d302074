#pragma once

#include "burnbox/cipher_rig.hpp"
#include "burnbox/key_wrap.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace burnbox {

struct Sealed {
    Packet packet;
    KeyHandle key;
};

class CryptoBox {
public:
    explicit CryptoBox(std::uint32_t kdf_iterations = default_kdf_iterations);

    Sealed seal(std::span<const std::uint8_t> content, std::optional<std::string_view> password, std::span<const std::uint8_t> aad) const;

    SecureBlob unlock(const KeyHandle& key, std::optional<std::string_view> password) const;

    SecureBlob open(const Packet& packet, const KeyHandle& key, std::optional<std::string_view> password, std::span<const std::uint8_t> aad) const;
    SecureBlob open_with(const Packet& packet, std::span<const std::uint8_t> content_key, std::span<const std::uint8_t> aad) const;

    std::uint32_t kdf_iterations() const;

private:
    std::uint32_t kdf_iterations_;
};

}
