#pragma once

#include "burnbox/cipher_rig.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace burnbox {

inline constexpr std::uint32_t default_kdf_iterations = 100000;

class KeyHandle {
public:
    static KeyHandle plain(std::span<const std::uint8_t, key_len> key);
    static KeyHandle wrapped(std::span<const std::uint8_t, salt_len> salt, Packet sealed_key, std::uint32_t iterations);

    KeyHandle() = default;
    KeyHandle(const KeyHandle&) = default;
    KeyHandle& operator=(const KeyHandle&) = default;
    ~KeyHandle();

    bool needs_password() const;
    bool empty() const;
    std::uint32_t iterations() const;
    std::span<const std::uint8_t> salt() const;
    const Packet& sealed_key() const;
    std::span<const std::uint8_t> raw_key() const;

    void wipe();

private:
    enum class Form : std::uint8_t {
        none,
        plain,
        wrapped
    };

    Form form_ = Form::none;
    std::array<std::uint8_t, key_len> key_{};
    std::array<std::uint8_t, salt_len> salt_{};
    Packet sealed_key_;
    std::uint32_t iterations_ = 0;
};

SecureBlob derive_wrap_key(std::string_view password, std::span<const std::uint8_t> salt, std::uint32_t iterations);
KeyHandle wrap_key(std::span<const std::uint8_t, key_len> key, std::string_view password, std::uint32_t iterations);
SecureBlob unwrap_key(const KeyHandle& handle, std::string_view password);

}
