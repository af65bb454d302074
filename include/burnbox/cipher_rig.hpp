#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <span>
#include <string>
#include <vector>

namespace burnbox {

inline constexpr std::size_t key_len = 32;
inline constexpr std::size_t nonce_len = 12;
inline constexpr std::size_t tag_len = 16;
inline constexpr std::size_t salt_len = 16;
inline constexpr std::size_t id_len = 16;

class SecureBlob {
public:
    SecureBlob() = default;
    explicit SecureBlob(std::vector<std::uint8_t> data);
    SecureBlob(SecureBlob&& other) noexcept;
    SecureBlob& operator=(SecureBlob&& other) noexcept;
    SecureBlob(const SecureBlob&) = delete;
    SecureBlob& operator=(const SecureBlob&) = delete;
    ~SecureBlob();

    std::span<const std::uint8_t> view() const;
    std::size_t size() const;
    bool empty() const;
    std::vector<std::uint8_t> take();
    void wipe();

private:
    std::vector<std::uint8_t> data_;
};

struct Packet {
    std::array<std::uint8_t, nonce_len> nonce{};
    std::vector<std::uint8_t> body;
    std::array<std::uint8_t, tag_len> mac{};
};

class CipherRig {
public:
    explicit CipherRig(std::span<const std::uint8_t> key);
    CipherRig(const CipherRig&) = delete;
    CipherRig& operator=(const CipherRig&) = delete;
    CipherRig(CipherRig&&) = delete;
    CipherRig& operator=(CipherRig&&) = delete;
    ~CipherRig();

    Packet seal(std::span<const std::uint8_t> plain, std::span<const std::uint8_t> aad) const;
    SecureBlob open(const Packet& pack, std::span<const std::uint8_t> aad) const;

private:
    std::array<std::uint8_t, key_len> key_{};
};

class AuthFailure : public std::exception {
public:
    const char* what() const noexcept override;
};

std::array<std::uint8_t, key_len> mint_key();
void fill_random(std::span<std::uint8_t> out);
void zero(std::span<std::uint8_t> data);

std::string hex_of(std::span<const std::uint8_t> data);
std::string b64url_of(std::span<const std::uint8_t> data);
std::array<std::uint8_t, 32> sha256_of(std::span<const std::uint8_t> data);

}
