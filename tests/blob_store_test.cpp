#include "burnbox/blob_store.hpp"
#include "burnbox/cipher_rig.hpp"
#include "burnbox/errors.hpp"
#include "burnbox/tier_policy.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <stop_token>
#include <string>

namespace {

using namespace std::chrono_literals;

void need(bool ok, const std::string& msg) {
    if (!ok) {
        throw std::runtime_error(msg);
    }
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

std::string slurp(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

class TempDir {
public:
    TempDir() {
        std::array<std::uint8_t, 8> raw{};
        burnbox::fill_random(raw);
        path_ = std::filesystem::temp_directory_path() / ("burnbox-blob-" + burnbox::hex_of(raw));
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const {
        return path_;
    }

    std::size_t entries() const {
        std::size_t n = 0;
        for (const auto& e : std::filesystem::directory_iterator(path_)) {
            static_cast<void>(e);
            ++n;
        }
        return n;
    }

private:
    std::filesystem::path path_;
};

burnbox::TierPolicy small_policy() {
    burnbox::TierPolicy policy;
    policy.set(burnbox::Tier::free, burnbox::TierLimits{16, 5, 1h, 15min});
    return policy;
}

void stage_fetch_purge(burnbox::BlobStore& store) {
    std::istringstream in("ciphertext");
    auto rec = store.stage("id-1", in, 10, burnbox::Tier::free);
    need(rec.transfer_id == "id-1" && rec.size == 10, "blob record fields");
    need(rec.ref.size() == 64 && rec.ref.find("id-1") == std::string::npos, "blob ref leaks the id");
    need(store.count() == 1, "blob not counted");

    auto out = store.fetch(rec);
    need(slurp(*out) == "ciphertext", "fetched bytes differ");

    store.purge(rec);
    need(rec.purged, "purge flag not set");
    need(store.count() == 0, "blob survived purge");
    store.purge(rec);
    need(faults_with(burnbox::Fault::not_found, [&] { static_cast<void>(store.fetch(rec)); }), "purged blob fetched");
}

void oversize_rejected(burnbox::BlobStore& store) {
    std::istringstream in(std::string(17, 'x'));
    need(faults_with(burnbox::Fault::size_limit_exceeded, [&] { static_cast<void>(store.stage("big", in, 17, burnbox::Tier::free)); }),
         "oversize declared size accepted");
    need(in.tellg() == 0, "oversize stream was read");

    std::istringstream longer(std::string(12, 'y'));
    need(faults_with(burnbox::Fault::size_limit_exceeded, [&] { static_cast<void>(store.stage("long", longer, 8, burnbox::Tier::free)); }),
         "stream past declared size accepted");
    need(store.count() == 0, "rejected blob left behind");

    std::istringstream premium(std::string(17, 'z'));
    static_cast<void>(store.stage("prem", premium, 17, burnbox::Tier::premium));
    need(store.count() == 1, "premium blob not staged");
}

void short_stream_fails(burnbox::BlobStore& store) {
    const auto before = store.count();
    std::istringstream in("abc");
    bool hit = false;
    try {
        static_cast<void>(store.stage("short", in, 8, burnbox::Tier::free));
    } catch (const std::invalid_argument&) {
        hit = true;
    }
    need(hit, "short stream not rejected as a caller error");
    need(store.count() == before, "short blob left behind");
}

void cancel_leaves_nothing(burnbox::BlobStore& store) {
    const auto before = store.count();
    std::stop_source src;
    src.request_stop();
    std::istringstream in("payload");
    need(faults_with(burnbox::Fault::canceled, [&] { static_cast<void>(store.stage("gone", in, 7, burnbox::Tier::free, src.get_token())); }),
         "canceled stage went through");
    need(store.count() == before, "canceled blob left behind");
}

void memory_store() {
    const auto policy = small_policy();
    burnbox::MemoryBlobStore store(policy);
    stage_fetch_purge(store);
    oversize_rejected(store);
    short_stream_fails(store);
    cancel_leaves_nothing(store);
}

void disk_store() {
    const TempDir tmp;
    const auto policy = small_policy();
    burnbox::DiskBlobStore store(tmp.path(), policy);
    need(std::filesystem::is_directory(tmp.path()), "blob dir not created");
    const auto perms = std::filesystem::status(tmp.path()).permissions();
    need((perms & std::filesystem::perms::others_all) == std::filesystem::perms::none, "blob dir readable by others");

    stage_fetch_purge(store);
    need(tmp.entries() == 0, "purged file still on disk");

    oversize_rejected(store);
    short_stream_fails(store);
    cancel_leaves_nothing(store);
    need(tmp.entries() == store.count(), "partial files left on disk");
}

void disk_store_reclaims_leftovers() {
    const TempDir tmp;
    const auto policy = small_policy();
    burnbox::BlobRecord keep;
    {
        burnbox::DiskBlobStore store(tmp.path(), policy);
        std::istringstream a("kept");
        keep = store.stage("id-keep", a, 4, burnbox::Tier::free);
        std::istringstream b("lost");
        static_cast<void>(store.stage("id-lost", b, 4, burnbox::Tier::free));
    }
    {
        std::ofstream part(tmp.path() / (std::string(64, 'c') + ".part"), std::ios::binary);
        part << "half written";
    }
    need(tmp.entries() == 3, "setup files missing");

    burnbox::DiskBlobStore again(tmp.path(), policy);
    need(tmp.entries() == 2, "interrupted upload survived reopen");
    need(again.reclaim({keep.ref}) == 1, "unreferenced blob not reclaimed");
    need(again.count() == 1 && tmp.entries() == 1, "leftover files still on disk");

    auto out = again.fetch(keep);
    need(slurp(*out) == "kept", "referenced blob damaged by reclaim");
    out.reset();

    need(again.reclaim({}) == 1, "last blob not reclaimed");
    need(tmp.entries() == 0, "blob dir not empty");
}

void memory_store_reclaims() {
    const auto policy = small_policy();
    burnbox::MemoryBlobStore store(policy);
    std::istringstream a("one");
    const auto keep = store.stage("id-a", a, 3, burnbox::Tier::free);
    std::istringstream b("two");
    static_cast<void>(store.stage("id-b", b, 3, burnbox::Tier::free));
    need(store.reclaim({keep.ref}) == 1 && store.count() == 1, "memory reclaim");
    auto out = store.fetch(keep);
    need(slurp(*out) == "one", "kept memory blob lost");
}

}

int main() {
    try {
        memory_store();
        disk_store();
        disk_store_reclaims_leftovers();
        memory_store_reclaims();
        std::cout << "blob store tests passed\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }
}
