#include "burnbox/crypto_box.hpp"
#include "burnbox/errors.hpp"
#include "burnbox/key_wrap.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr std::uint32_t test_iterations = 1000;

void need(bool ok, const std::string& msg) {
    if (!ok) {
        throw std::runtime_error(msg);
    }
}

std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

std::string text_of(const burnbox::SecureBlob& blob) {
    const auto v = blob.view();
    return std::string(v.begin(), v.end());
}

template <typename Fn>
bool faults_with(burnbox::Fault want, Fn&& fn) {
    try {
        fn();
    } catch (const burnbox::TransferError& ex) {
        return ex.fault() == want;
    }
    return false;
}

void plain_roundtrip() {
    const burnbox::CryptoBox box(test_iterations);
    const auto aad = bytes_of("id|1|900");
    const auto sealed = box.seal(bytes_of("hello"), std::nullopt, aad);
    need(!sealed.key.needs_password(), "plain transfer asked for a password");
    need(text_of(box.open(sealed.packet, sealed.key, std::nullopt, aad)) == "hello", "plain roundtrip mismatch");
    // a password supplied for an unprotected transfer is ignored
    need(text_of(box.open(sealed.packet, sealed.key, "whatever", aad)) == "hello", "stray password broke plain open");
}

void empty_password_means_none() {
    const burnbox::CryptoBox box(test_iterations);
    const auto sealed = box.seal(bytes_of("hi"), std::string_view(""), {});
    need(!sealed.key.needs_password(), "empty password should not wrap the key");
}

void password_roundtrip() {
    const burnbox::CryptoBox box(test_iterations);
    const auto aad = bytes_of("hdr");
    const auto sealed = box.seal(bytes_of("hello"), std::string_view("pw"), aad);
    need(sealed.key.needs_password(), "password transfer not wrapped");
    need(sealed.key.iterations() == test_iterations, "iteration count not recorded");
    need(text_of(box.open(sealed.packet, sealed.key, "pw", aad)) == "hello", "password roundtrip mismatch");

    bool hit = false;
    try {
        static_cast<void>(sealed.key.raw_key());
    } catch (const std::runtime_error&) {
        hit = true;
    }
    need(hit, "wrapped handle exposed a raw key");
}

void wrong_password_rejected() {
    const burnbox::CryptoBox box(test_iterations);
    const auto sealed = box.seal(bytes_of("hello"), std::string_view("pw"), {});
    need(faults_with(burnbox::Fault::wrong_password, [&] { static_cast<void>(box.unlock(sealed.key, "PW")); }), "wrong password accepted");
    need(faults_with(burnbox::Fault::wrong_password, [&] { static_cast<void>(box.unlock(sealed.key, std::nullopt)); }), "missing password accepted");
    need(faults_with(burnbox::Fault::wrong_password, [&] { static_cast<void>(box.unlock(sealed.key, "")); }), "empty password accepted");
}

void tampered_body_is_corrupt() {
    const burnbox::CryptoBox box(test_iterations);
    const auto aad = bytes_of("hdr");
    auto sealed = box.seal(bytes_of("hello"), std::string_view("pw"), aad);
    sealed.packet.body[1] ^= 0x40U;
    need(faults_with(burnbox::Fault::corrupt_payload, [&] { static_cast<void>(box.open(sealed.packet, sealed.key, "pw", aad)); }),
         "tampered body not reported as corrupt");
}

void foreign_aad_is_corrupt() {
    const burnbox::CryptoBox box(test_iterations);
    const auto sealed = box.seal(bytes_of("hello"), std::nullopt, bytes_of("expires:100"));
    need(faults_with(burnbox::Fault::corrupt_payload, [&] { static_cast<void>(box.open(sealed.packet, sealed.key, std::nullopt, bytes_of("expires:999"))); }),
         "edited aad not reported as corrupt");
}

void empty_handle_is_corrupt() {
    const burnbox::CryptoBox box(test_iterations);
    const burnbox::KeyHandle none;
    need(faults_with(burnbox::Fault::corrupt_payload, [&] { static_cast<void>(box.unlock(none, "pw")); }), "empty handle not corrupt");
}

void derive_is_deterministic() {
    const auto salt = bytes_of("0123456789abcdef");
    const auto a = burnbox::derive_wrap_key("pw", salt, test_iterations);
    const auto b = burnbox::derive_wrap_key("pw", salt, test_iterations);
    const auto c = burnbox::derive_wrap_key("pw", salt, test_iterations + 1);
    need(a.size() == burnbox::key_len, "derived key length");
    need(std::equal(a.view().begin(), a.view().end(), b.view().begin()), "pbkdf2 not deterministic");
    need(!std::equal(a.view().begin(), a.view().end(), c.view().begin()), "iteration count ignored");
}

void wrap_uses_fresh_salt() {
    const auto key = burnbox::mint_key();
    const auto one = burnbox::wrap_key(key, "pw", test_iterations);
    const auto two = burnbox::wrap_key(key, "pw", test_iterations);
    need(!std::equal(one.salt().begin(), one.salt().end(), two.salt().begin()), "salt reused");
    const auto back = burnbox::unwrap_key(two, "pw");
    need(std::equal(back.view().begin(), back.view().end(), key.begin()), "unwrap mismatch");
}

void wipe_empties_handle() {
    const burnbox::CryptoBox box(test_iterations);
    auto sealed = box.seal(bytes_of("hello"), std::nullopt, {});
    sealed.key.wipe();
    need(sealed.key.empty(), "wipe left key material");
}

}

int main() {
    try {
        plain_roundtrip();
        empty_password_means_none();
        password_roundtrip();
        wrong_password_rejected();
        tampered_body_is_corrupt();
        foreign_aad_is_corrupt();
        empty_handle_is_corrupt();
        derive_is_deterministic();
        wrap_uses_fresh_salt();
        wipe_empties_handle();
        std::cout << "crypto box tests passed\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }
}
