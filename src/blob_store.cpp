#include "burnbox/blob_store.hpp"

#include "burnbox/cipher_rig.hpp"
#include "burnbox/errors.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <set>
#include <span>
#include <sstream>
#include <stdexcept>

namespace burnbox {
namespace {

[[noreturn]] void io_fail(const std::string& what) {
    throw TransferError(Fault::storage_unavailable, what);
}

class Fd {
public:
    explicit Fd(int fd) : fd_(fd) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    int get() const {
        return fd_;
    }

    int release() {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_;
};

void write_all(int fd, const std::uint8_t* data, std::size_t len, off_t at) {
    while (len > 0) {
        const ssize_t n = ::pwrite(fd, data, len, at);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            io_fail(std::string("write failed: ") + std::strerror(errno));
        }
        data += n;
        len -= static_cast<std::size_t>(n);
        at += n;
    }
}

void wipe_file(const std::filesystem::path& path) {
    Fd fd(::open(path.c_str(), O_WRONLY | O_CLOEXEC));
    if (fd.get() < 0) {
        if (errno == ENOENT) {
            return;
        }
        io_fail(std::string("cannot open blob for wipe: ") + std::strerror(errno));
    }
    struct stat st {};
    if (::fstat(fd.get(), &st) != 0) {
        io_fail(std::string("cannot stat blob: ") + std::strerror(errno));
    }
    const std::vector<std::uint8_t> blank(64 * 1024, 0);
    off_t at = 0;
    while (at < st.st_size) {
        const auto n = static_cast<std::size_t>(std::min<off_t>(st.st_size - at, static_cast<off_t>(blank.size())));
        write_all(fd.get(), blank.data(), n, at);
        at += static_cast<off_t>(n);
    }
    if (::fsync(fd.get()) != 0) {
        io_fail(std::string("fsync failed: ") + std::strerror(errno));
    }
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        io_fail(std::string("unlink failed: ") + std::strerror(errno));
    }
}

}

template <typename Sink>
void BlobStore::pump(std::istream& in, std::uint64_t size, std::stop_token stop, Sink&& sink) {
    std::vector<std::uint8_t> buf(chunk_len);
    std::uint64_t left = size;
    while (left > 0) {
        if (stop.stop_requested()) {
            throw TransferError(Fault::canceled);
        }
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(left, buf.size()));
        in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0) {
            zero(buf);
            throw std::invalid_argument("content stream shorter than declared size");
        }
        sink(std::span<const std::uint8_t>(buf.data(), got));
        left -= got;
    }
    zero(buf);
    if (in.peek() != std::char_traits<char>::eof()) {
        throw TransferError(Fault::size_limit_exceeded, "content longer than declared");
    }
}

BlobStore::BlobStore(const TierPolicy& policy) : policy_(policy) {}

BlobRecord BlobStore::stage(const std::string& transfer_id, std::istream& in, std::uint64_t size, Tier tier, std::stop_token stop) {
    if (size > policy_.limits(tier).max_content_size) {
        throw TransferError(Fault::size_limit_exceeded);
    }
    if (stop.stop_requested()) {
        throw TransferError(Fault::canceled);
    }
    const auto digest = sha256_of(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(transfer_id.data()), transfer_id.size()));
    BlobRecord rec;
    rec.transfer_id = transfer_id;
    rec.ref = hex_of(digest);
    rec.size = size;
    put(rec.ref, in, size, stop);
    return rec;
}

std::unique_ptr<std::istream> BlobStore::fetch(const BlobRecord& rec) {
    if (rec.purged) {
        throw TransferError(Fault::not_found);
    }
    return get(rec.ref);
}

void BlobStore::purge(BlobRecord& rec) {
    if (rec.purged) {
        return;
    }
    drop(rec.ref);
    rec.purged = true;
}

std::size_t BlobStore::reclaim(const std::unordered_set<std::string>& keep) {
    std::size_t gone = 0;
    for (const auto& ref : leftovers()) {
        if (keep.count(ref) != 0) {
            continue;
        }
        try {
            drop(ref);
            ++gone;
        } catch (const TransferError& ex) {
            spdlog::warn("leftover blob {} not reclaimed: {}", ref.substr(0, 8), ex.what());
        }
    }
    return gone;
}

DiskBlobStore::DiskBlobStore(std::filesystem::path dir, const TierPolicy& policy) : BlobStore(policy), dir_(std::move(dir)) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        io_fail("cannot create blob dir " + dir_.string() + ": " + ec.message());
    }
    std::filesystem::permissions(dir_, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("blob dir {} permissions not tightened: {}", dir_.string(), ec.message());
    }

    std::vector<std::filesystem::path> parts;
    for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
        if (entry.path().extension() == ".part") {
            parts.push_back(entry.path());
        }
    }
    for (const auto& part : parts) {
        try {
            wipe_file(part);
        } catch (const TransferError& ex) {
            spdlog::warn("interrupted upload not wiped: {}", ex.what());
        }
    }
    if (!parts.empty()) {
        spdlog::info("wiped {} interrupted upload(s) in {}", parts.size(), dir_.string());
    }
}

const std::filesystem::path& DiskBlobStore::dir() const {
    return dir_;
}

std::filesystem::path DiskBlobStore::path_of(const std::string& ref) const {
    return dir_ / (ref + ".blob");
}

std::size_t DiskBlobStore::count() const {
    std::error_code ec;
    std::size_t n = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
        if (entry.path().extension() == ".blob") {
            ++n;
        }
    }
    return n;
}

void DiskBlobStore::put(const std::string& ref, std::istream& in, std::uint64_t size, std::stop_token stop) {
    const auto final_path = path_of(ref);
    const auto part_path = dir_ / (ref + ".part");
    Fd fd(::open(part_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR));
    if (fd.get() < 0) {
        io_fail(std::string("cannot open staging file: ") + std::strerror(errno));
    }

    try {
        off_t at = 0;
        pump(in, size, stop, [&](std::span<const std::uint8_t> chunk) {
            write_all(fd.get(), chunk.data(), chunk.size(), at);
            at += static_cast<off_t>(chunk.size());
        });
        if (::fsync(fd.get()) != 0) {
            io_fail(std::string("fsync failed: ") + std::strerror(errno));
        }
        if (::close(fd.release()) != 0) {
            io_fail(std::string("close failed: ") + std::strerror(errno));
        }
        std::error_code ec;
        std::filesystem::rename(part_path, final_path, ec);
        if (ec) {
            io_fail("cannot publish blob: " + ec.message());
        }
    } catch (...) {
        try {
            drop(ref);
        } catch (const TransferError& ex) {
            spdlog::warn("partial blob left behind after failed stage: {}", ex.what());
        }
        throw;
    }
}

std::vector<std::string> DiskBlobStore::leftovers() const {
    std::set<std::string> refs;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
        const auto ext = entry.path().extension();
        if (ext == ".blob" || ext == ".part") {
            refs.insert(entry.path().stem().string());
        }
    }
    if (ec) {
        io_fail("cannot list blob dir: " + ec.message());
    }
    return std::vector<std::string>(refs.begin(), refs.end());
}

std::unique_ptr<std::istream> DiskBlobStore::get(const std::string& ref) {
    const auto path = path_of(ref);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            io_fail("cannot stat blob: " + ec.message());
        }
        throw TransferError(Fault::not_found);
    }
    auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*in) {
        io_fail("cannot open blob for reading");
    }
    return in;
}

void DiskBlobStore::drop(const std::string& ref) {
    wipe_file(path_of(ref));
    wipe_file(dir_ / (ref + ".part"));
}

MemoryBlobStore::MemoryBlobStore(const TierPolicy& policy) : BlobStore(policy) {}

MemoryBlobStore::~MemoryBlobStore() {
    std::scoped_lock lock(mu_);
    for (auto& [_, bytes] : slots_) {
        zero(bytes);
    }
}

std::size_t MemoryBlobStore::count() const {
    std::scoped_lock lock(mu_);
    return slots_.size();
}

void MemoryBlobStore::put(const std::string& ref, std::istream& in, std::uint64_t size, std::stop_token stop) {
    std::vector<std::uint8_t> bytes;
    bytes.reserve(static_cast<std::size_t>(size));
    try {
        pump(in, size, stop, [&](std::span<const std::uint8_t> chunk) {
            bytes.insert(bytes.end(), chunk.begin(), chunk.end());
        });
    } catch (...) {
        zero(bytes);
        throw;
    }
    std::scoped_lock lock(mu_);
    auto [it, fresh] = slots_.emplace(ref, std::move(bytes));
    if (!fresh) {
        io_fail("blob ref already staged");
    }
}

std::unique_ptr<std::istream> MemoryBlobStore::get(const std::string& ref) {
    std::scoped_lock lock(mu_);
    const auto it = slots_.find(ref);
    if (it == slots_.end()) {
        throw TransferError(Fault::not_found);
    }
    return std::make_unique<std::istringstream>(std::string(it->second.begin(), it->second.end()));
}

std::vector<std::string> MemoryBlobStore::leftovers() const {
    std::scoped_lock lock(mu_);
    std::vector<std::string> refs;
    refs.reserve(slots_.size());
    for (const auto& [ref, _] : slots_) {
        refs.push_back(ref);
    }
    return refs;
}

void MemoryBlobStore::drop(const std::string& ref) {
    std::scoped_lock lock(mu_);
    const auto it = slots_.find(ref);
    if (it == slots_.end()) {
        return;
    }
    zero(it->second);
    slots_.erase(it);
}

}
