#include "burnbox/cipher_rig.hpp"

#include <limits>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace burnbox {
namespace {

using EvpPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

[[noreturn]] void toss(const std::string& msg) {
    throw std::runtime_error(msg);
}

void chk(int code, const char* msg) {
    if (code != 1) {
        toss(msg);
    }
}

void chk_open_ssl_size(std::size_t size, const char* label) {
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        toss(std::string(label) + " too large");
    }
}

EvpPtr gcm_ctx(const std::array<std::uint8_t, key_len>& key, const std::array<std::uint8_t, nonce_len>& nonce, bool sealing,
               std::span<const std::uint8_t> aad) {
    chk_open_ssl_size(aad.size(), "aad");
    EvpPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        toss("cipher context allocation failed");
    }
    const int enc = sealing ? 1 : 0;
    chk(EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc), "gcm init failed");
    chk(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr), "gcm nonce length rejected");
    chk(EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc), "gcm key schedule failed");
    if (!aad.empty()) {
        int n = 0;
        chk(EVP_CipherUpdate(ctx.get(), nullptr, &n, aad.data(), static_cast<int>(aad.size())), "gcm aad rejected");
    }
    return ctx;
}

std::size_t gcm_step(EVP_CIPHER_CTX* ctx, std::span<const std::uint8_t> in, std::uint8_t* out) {
    chk_open_ssl_size(in.size(), "gcm input");
    if (in.empty()) {
        return 0;
    }
    int n = 0;
    chk(EVP_CipherUpdate(ctx, out, &n, in.data(), static_cast<int>(in.size())), "gcm update failed");
    return static_cast<std::size_t>(n);
}

}

void zero(std::span<std::uint8_t> data) {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
}

const char* AuthFailure::what() const noexcept {
    return "authentication failed";
}

SecureBlob::SecureBlob(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

SecureBlob::SecureBlob(SecureBlob&& other) noexcept : data_(std::move(other.data_)) {}

SecureBlob& SecureBlob::operator=(SecureBlob&& other) noexcept {
    if (this != &other) {
        zero(data_);
        data_ = std::move(other.data_);
    }
    return *this;
}

SecureBlob::~SecureBlob() {
    zero(data_);
}

std::span<const std::uint8_t> SecureBlob::view() const {
    return data_;
}

std::size_t SecureBlob::size() const {
    return data_.size();
}

bool SecureBlob::empty() const {
    return data_.empty();
}

std::vector<std::uint8_t> SecureBlob::take() {
    return std::move(data_);
}

void SecureBlob::wipe() {
    zero(data_);
    data_.clear();
    data_.shrink_to_fit();
}

CipherRig::CipherRig(std::span<const std::uint8_t> key) {
    if (key.size() != key_.size()) {
        toss("cipher key must be 32 bytes");
    }
    std::copy(key.begin(), key.end(), key_.begin());
}

CipherRig::~CipherRig() {
    zero(key_);
}

Packet CipherRig::seal(std::span<const std::uint8_t> plain, std::span<const std::uint8_t> aad) const {
    Packet pack;
    fill_random(pack.nonce);
    pack.body.resize(plain.size());

    const auto ctx = gcm_ctx(key_, pack.nonce, true, aad);
    const auto done = gcm_step(ctx.get(), plain, pack.body.data());
    int tail = 0;
    chk(EVP_CipherFinal_ex(ctx.get(), pack.body.data() + done, &tail), "gcm seal did not finish");
    if (done + static_cast<std::size_t>(tail) != pack.body.size()) {
        toss("gcm seal produced an odd length");
    }
    chk(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(tag_len), pack.mac.data()), "gcm tag unavailable");
    return pack;
}

SecureBlob CipherRig::open(const Packet& pack, std::span<const std::uint8_t> aad) const {
    std::vector<std::uint8_t> plain(pack.body.size());

    const auto ctx = gcm_ctx(key_, pack.nonce, false, aad);
    std::size_t done = 0;
    try {
        done = gcm_step(ctx.get(), pack.body, plain.data());
    } catch (const std::runtime_error&) {
        zero(plain);
        throw;
    }
    auto mac = pack.mac;
    chk(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(mac.size()), mac.data()), "gcm tag rejected");

    int tail = 0;
    if (EVP_CipherFinal_ex(ctx.get(), plain.data() + done, &tail) != 1 || done + static_cast<std::size_t>(tail) != plain.size()) {
        zero(plain);
        throw AuthFailure();
    }
    return SecureBlob(std::move(plain));
}

std::array<std::uint8_t, key_len> mint_key() {
    std::array<std::uint8_t, key_len> key{};
    fill_random(key);
    return key;
}

void fill_random(std::span<std::uint8_t> out) {
    chk_open_ssl_size(out.size(), "random request");
    chk(RAND_bytes(out.data(), static_cast<int>(out.size())), "random generation failed");
}

std::string hex_of(std::span<const std::uint8_t> data) {
    static constexpr char lut[] = "0123456789abcdef";
    std::string out;
    out.resize(data.size() * 2);
    for (std::size_t i = 0; i < data.size(); ++i) {
        out[i * 2] = lut[data[i] >> 4];
        out[i * 2 + 1] = lut[data[i] & 0x0F];
    }
    return out;
}

std::string b64url_of(std::span<const std::uint8_t> data) {
    chk_open_ssl_size(data.size(), "base64 input");
    std::string out;
    out.resize(4 * ((data.size() + 2) / 3) + 1);
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(), static_cast<int>(data.size()));
    if (n < 0) {
        toss("base64 encode failed");
    }
    out.resize(static_cast<std::size_t>(n));
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

std::array<std::uint8_t, 32> sha256_of(std::span<const std::uint8_t> data) {
    std::array<std::uint8_t, 32> out{};
    unsigned int len = 0;
    chk(EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr), "digest failed");
    if (len != out.size()) {
        toss("unexpected digest size");
    }
    return out;
}

}
