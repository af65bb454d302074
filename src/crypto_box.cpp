#include "burnbox/crypto_box.hpp"

#include "burnbox/errors.hpp"

#include <stdexcept>
#include <vector>

namespace burnbox {

CryptoBox::CryptoBox(std::uint32_t kdf_iterations) : kdf_iterations_(kdf_iterations) {
    if (kdf_iterations_ == 0) {
        throw std::invalid_argument("kdf iterations cannot be zero");
    }
}

Sealed CryptoBox::seal(std::span<const std::uint8_t> content, std::optional<std::string_view> password, std::span<const std::uint8_t> aad) const {
    auto key = mint_key();
    Sealed out;
    {
        const CipherRig rig(key);
        out.packet = rig.seal(content, aad);
    }
    if (password && !password->empty()) {
        out.key = wrap_key(key, *password, kdf_iterations_);
    } else {
        out.key = KeyHandle::plain(key);
    }
    zero(key);
    return out;
}

SecureBlob CryptoBox::unlock(const KeyHandle& key, std::optional<std::string_view> password) const {
    if (key.empty()) {
        throw TransferError(Fault::corrupt_payload, "key material missing");
    }
    if (!key.needs_password()) {
        const auto raw = key.raw_key();
        return SecureBlob(std::vector<std::uint8_t>(raw.begin(), raw.end()));
    }
    if (!password || password->empty()) {
        throw TransferError(Fault::wrong_password);
    }
    try {
        return unwrap_key(key, *password);
    } catch (const AuthFailure&) {
        throw TransferError(Fault::wrong_password);
    }
}

SecureBlob CryptoBox::open(const Packet& packet, const KeyHandle& key, std::optional<std::string_view> password, std::span<const std::uint8_t> aad) const {
    const SecureBlob content_key = unlock(key, password);
    return open_with(packet, content_key.view(), aad);
}

SecureBlob CryptoBox::open_with(const Packet& packet, std::span<const std::uint8_t> content_key, std::span<const std::uint8_t> aad) const {
    const CipherRig rig(content_key);
    try {
        return rig.open(packet, aad);
    } catch (const AuthFailure&) {
        throw TransferError(Fault::corrupt_payload);
    }
}

std::uint32_t CryptoBox::kdf_iterations() const {
    return kdf_iterations_;
}

}
