#include "burnbox/key_wrap.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace burnbox {
namespace {

[[noreturn]] void die(const std::string& msg) {
    throw std::runtime_error(msg);
}

void chk(int code, const char* msg) {
    if (code != 1) {
        die(msg);
    }
}

}

KeyHandle KeyHandle::plain(std::span<const std::uint8_t, key_len> key) {
    KeyHandle h;
    h.form_ = Form::plain;
    std::copy(key.begin(), key.end(), h.key_.begin());
    return h;
}

KeyHandle KeyHandle::wrapped(std::span<const std::uint8_t, salt_len> salt, Packet sealed_key, std::uint32_t iterations) {
    if (iterations == 0) {
        die("kdf iterations cannot be zero");
    }
    if (sealed_key.body.size() != key_len) {
        die("wrapped key has wrong length");
    }
    KeyHandle h;
    h.form_ = Form::wrapped;
    std::copy(salt.begin(), salt.end(), h.salt_.begin());
    h.sealed_key_ = std::move(sealed_key);
    h.iterations_ = iterations;
    return h;
}

KeyHandle::~KeyHandle() {
    wipe();
}

bool KeyHandle::needs_password() const {
    return form_ == Form::wrapped;
}

bool KeyHandle::empty() const {
    return form_ == Form::none;
}

std::uint32_t KeyHandle::iterations() const {
    return iterations_;
}

std::span<const std::uint8_t> KeyHandle::salt() const {
    return salt_;
}

const Packet& KeyHandle::sealed_key() const {
    return sealed_key_;
}

std::span<const std::uint8_t> KeyHandle::raw_key() const {
    if (form_ != Form::plain) {
        die("key handle holds no raw key");
    }
    return key_;
}

void KeyHandle::wipe() {
    zero(key_);
    zero(sealed_key_.body);
    sealed_key_.body.clear();
    form_ = Form::none;
}

SecureBlob derive_wrap_key(std::string_view password, std::span<const std::uint8_t> salt, std::uint32_t iterations) {
    if (iterations == 0) {
        die("kdf iterations cannot be zero");
    }

    std::vector<std::uint8_t> out(key_len);
    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "PBKDF2", nullptr);
    if (!kdf) {
        die("pbkdf2 fetch failed");
    }

    EVP_KDF_CTX* kctx = EVP_KDF_CTX_new(kdf);
    EVP_KDF_free(kdf);
    if (!kctx) {
        die("pbkdf2 context failed");
    }

    unsigned int iter = iterations;
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, const_cast<char*>("SHA256"), 0),
        OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, const_cast<char*>(password.data()), password.size()),
        OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, const_cast<unsigned char*>(salt.data()), salt.size()),
        OSSL_PARAM_construct_uint(OSSL_KDF_PARAM_ITER, &iter),
        OSSL_PARAM_construct_end()};

    const int ok = EVP_KDF_derive(kctx, out.data(), out.size(), params);
    EVP_KDF_CTX_free(kctx);
    if (ok != 1) {
        zero(out);
        die("pbkdf2 derive failed");
    }
    return SecureBlob(std::move(out));
}

KeyHandle wrap_key(std::span<const std::uint8_t, key_len> key, std::string_view password, std::uint32_t iterations) {
    std::array<std::uint8_t, salt_len> salt{};
    fill_random(salt);
    const SecureBlob wrap = derive_wrap_key(password, salt, iterations);
    const CipherRig rig(wrap.view());
    Packet sealed = rig.seal(key, salt);
    return KeyHandle::wrapped(salt, std::move(sealed), iterations);
}

SecureBlob unwrap_key(const KeyHandle& handle, std::string_view password) {
    if (!handle.needs_password()) {
        die("key handle is not wrapped");
    }
    const SecureBlob wrap = derive_wrap_key(password, handle.salt(), handle.iterations());
    const CipherRig rig(wrap.view());
    SecureBlob key = rig.open(handle.sealed_key(), handle.salt());
    if (key.size() != key_len) {
        throw AuthFailure();
    }
    return key;
}

}
