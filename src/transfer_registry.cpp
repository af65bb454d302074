#include "burnbox/transfer_registry.hpp"

#include "burnbox/errors.hpp"
#include "burnbox/log.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <exception>
#include <istream>
#include <stdexcept>
#include <streambuf>
#include <unordered_set>
#include <utility>

namespace burnbox {
namespace {

constexpr std::size_t read_chunk = 64 * 1024;

void put_u64(std::vector<std::uint8_t>& out, std::uint64_t v) {
    for (int i = 7; i >= 0; --i) {
        out.push_back(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFFU));
    }
}

std::vector<std::uint8_t> aad_for(const std::string& id, Kind kind, std::uint64_t expires_at) {
    std::vector<std::uint8_t> out;
    out.reserve(id.size() + 1 + 8);
    out.insert(out.end(), id.begin(), id.end());
    out.push_back(static_cast<std::uint8_t>(kind));
    put_u64(out, expires_at);
    return out;
}

class SpanBuf : public std::streambuf {
public:
    explicit SpanBuf(std::span<const std::uint8_t> data) {
        auto* p = const_cast<char*>(reinterpret_cast<const char*>(data.data()));
        setg(p, p, p + data.size());
    }
};

}

TransferRegistry::TransferRegistry(TransferStore& store, BlobStore& blobs, QuotaTracker& quota, const TierPolicy& policy, const CryptoBox& crypto,
                                   const Clock& clock, std::uint32_t max_password_attempts)
    : store_(store), blobs_(blobs), quota_(quota), policy_(policy), crypto_(crypto), clock_(clock), max_attempts_(max_password_attempts) {
    if (max_attempts_ == 0) {
        throw std::invalid_argument("password attempt bound cannot be zero");
    }
}

TransferRegistry::~TransferRegistry() {
    try {
        const auto left = drain();
        if (left > 0) {
            spdlog::error("{} transfer(s) left unpurged at shutdown", left);
        }
    } catch (const std::exception& ex) {
        spdlog::error("shutdown purge aborted: {}", ex.what());
    }
}

std::string TransferRegistry::fresh_id() const {
    std::array<std::uint8_t, id_len> raw{};
    fill_random(raw);
    return b64url_of(raw);
}

Ticket TransferRegistry::create(const CreateRequest& req, std::stop_token stop) {
    if (req.content.empty()) {
        throw std::invalid_argument("transfer content is empty");
    }
    const auto now = clock_.now_ms();
    const auto& lim = policy_.limits(req.tier);
    if (req.content.size() > lim.max_content_size) {
        spdlog::info("create rejected for {}: {} bytes over the {} limit", req.owner, req.content.size(), tier_name(req.tier));
        throw TransferError(Fault::size_limit_exceeded);
    }
    if (!req.quota_exempt && !quota_.admit(req.owner, req.tier, now)) {
        spdlog::info("create rejected for {}: {} quota used up", req.owner, tier_name(req.tier));
        throw TransferError(Fault::quota_exceeded);
    }

    std::optional<BlobRecord> staged;
    try {
        if (stop.stop_requested()) {
            throw TransferError(Fault::canceled);
        }

        TransferRecord rec;
        rec.id = fresh_id();
        rec.owner = req.owner;
        rec.kind = req.kind;
        rec.tier = req.tier;
        rec.file_name = req.file_name;
        rec.size = req.content.size();
        rec.created_at = now;
        rec.expires_at = now + static_cast<std::uint64_t>(lim.expiry.count());

        std::optional<std::string_view> password;
        if (req.password) {
            password = *req.password;
        }
        Sealed sealed = crypto_.seal(req.content, password, aad_for(rec.id, rec.kind, rec.expires_at));
        rec.packet = std::move(sealed.packet);
        rec.key = sealed.key;
        sealed.key.wipe();

        if (rec.kind == Kind::file) {
            SpanBuf buf(rec.packet.body);
            std::istream in(&buf);
            staged = blobs_.stage(rec.id, in, rec.packet.body.size(), req.tier, stop);
            rec.blob = staged;
            rec.packet.body.clear();
        }

        if (stop.stop_requested()) {
            throw TransferError(Fault::canceled);
        }

        Ticket ticket{rec.id, rec.expires_at};
        const auto tag = log::id_tag(rec.id);
        const bool locked_by_password = rec.key.needs_password();
        {
            std::scoped_lock lock(mu_);
            if (!store_.insert(std::move(rec))) {
                throw std::runtime_error("transfer id collision");
            }
        }
        spdlog::info("transfer {} created: kind={} tier={} size={} password={}", tag, kind_name(req.kind), tier_name(req.tier), req.content.size(),
                     locked_by_password);
        return ticket;
    } catch (...) {
        if (staged) {
            try {
                blobs_.purge(*staged);
            } catch (const TransferError& ex) {
                spdlog::error("rollback could not purge staged blob: {}", ex.what());
            }
        }
        if (!req.quota_exempt) {
            quota_.refund(req.owner, now);
        }
        throw;
    }
}

Delivery TransferRegistry::retrieve(const std::string& id, std::optional<std::string_view> password, std::stop_token stop) {
    KeyHandle key;
    bool lapsed = false;
    {
        std::scoped_lock lock(mu_);
        auto* rec = store_.find(id);
        if (!rec || rec->state == State::consumed || rec->state == State::deleted) {
            throw TransferError(Fault::not_found);
        }
        if (rec->state == State::expired) {
            throw TransferError(Fault::expired);
        }
        if (rec->due(clock_.now_ms())) {
            rec->state = State::expired;
            lapsed = true;
        } else {
            key = rec->key;
        }
    }
    if (lapsed) {
        expire_now(id);
    }

    if (key.needs_password() && (!password || password->empty())) {
        throw TransferError(Fault::wrong_password);
    }
    SecureBlob content_key;
    try {
        content_key = crypto_.unlock(key, password);
    } catch (const TransferError& ex) {
        if (ex.fault() == Fault::wrong_password) {
            note_wrong_password(id);
        }
        throw;
    }
    key.wipe();

    if (stop.stop_requested()) {
        throw TransferError(Fault::canceled);
    }

    Claim c = claim(id);
    const auto tag = log::id_tag(id);
    SecureBlob plain;
    try {
        if (c.blob) {
            c.packet.body = read_blob(*c.blob, stop).take();
        }
        plain = crypto_.open_with(c.packet, content_key.view(), aad_for(id, c.kind, c.expires_at));
    } catch (const TransferError& ex) {
        if (ex.fault() == Fault::storage_unavailable || ex.fault() == Fault::canceled) {
            unclaim(id);
            throw;
        }
        release_claim(id);
        spdlog::warn("transfer {} destroyed: {}", tag, ex.what());
        if (!purge(id)) {
            spdlog::warn("transfer {} purge deferred to sweep", tag);
        }
        throw;
    } catch (...) {
        unclaim(id);
        throw;
    }

    release_claim(id);
    if (!purge(id)) {
        spdlog::warn("transfer {} consumed, purge deferred to sweep", tag);
    }
    spdlog::info("transfer {} delivered", tag);
    return Delivery{c.kind, std::move(plain), std::move(c.file_name)};
}

Preview TransferRegistry::peek(const std::string& id) {
    {
        std::scoped_lock lock(mu_);
        auto* rec = store_.find(id);
        if (!rec || rec->state == State::consumed || rec->state == State::deleted) {
            throw TransferError(Fault::not_found);
        }
        if (rec->state == State::expired) {
            throw TransferError(Fault::expired);
        }
        if (!rec->due(clock_.now_ms())) {
            return Preview{rec->kind, rec->key.needs_password(), rec->size, rec->file_name, rec->expires_at};
        }
        rec->state = State::expired;
    }
    expire_now(id);
}

TransferRegistry::Claim TransferRegistry::claim(const std::string& id) {
    {
        std::scoped_lock lock(mu_);
        auto* rec = store_.find(id);
        if (!rec || rec->state == State::consumed || rec->state == State::deleted) {
            throw TransferError(Fault::not_found);
        }
        if (rec->state == State::expired) {
            throw TransferError(Fault::expired);
        }
        if (!rec->due(clock_.now_ms())) {
            rec->state = State::consumed;
            rec->in_flight = true;
            return Claim{rec->kind, rec->packet, rec->blob, rec->file_name, rec->expires_at};
        }
        rec->state = State::expired;
    }
    expire_now(id);
}

void TransferRegistry::unclaim(const std::string& id) {
    std::scoped_lock lock(mu_);
    if (auto* rec = store_.find(id)) {
        rec->state = State::active;
        rec->in_flight = false;
    }
}

void TransferRegistry::release_claim(const std::string& id) {
    std::scoped_lock lock(mu_);
    if (auto* rec = store_.find(id)) {
        rec->in_flight = false;
    }
}

void TransferRegistry::note_wrong_password(const std::string& id) {
    std::uint32_t attempts = 0;
    bool burn = false;
    {
        std::scoped_lock lock(mu_);
        auto* rec = store_.find(id);
        if (!rec || rec->state != State::active) {
            return;
        }
        attempts = ++rec->failed_attempts;
        if (attempts >= max_attempts_) {
            rec->state = State::expired;
            burn = true;
        }
    }
    const auto tag = log::id_tag(id);
    spdlog::debug("wrong password for transfer {} ({}/{})", tag, attempts, max_attempts_);
    if (burn) {
        spdlog::warn("transfer {} burned after {} wrong passwords", tag, attempts);
        if (!purge(id)) {
            spdlog::warn("transfer {} purge deferred to sweep", tag);
        }
    }
}

void TransferRegistry::expire_now(const std::string& id) {
    const auto tag = log::id_tag(id);
    spdlog::debug("transfer {} expired on access", tag);
    if (!purge(id)) {
        spdlog::warn("transfer {} purge deferred to sweep", tag);
    }
    throw TransferError(Fault::expired);
}

SecureBlob TransferRegistry::read_blob(const BlobRecord& blob, std::stop_token stop) {
    auto in = blobs_.fetch(blob);
    std::vector<std::uint8_t> out(static_cast<std::size_t>(blob.size));
    std::size_t at = 0;
    while (at < out.size()) {
        if (stop.stop_requested()) {
            throw TransferError(Fault::canceled);
        }
        const auto want = std::min(out.size() - at, read_chunk);
        in->read(reinterpret_cast<char*>(out.data() + at), static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(in->gcount());
        if (got == 0) {
            throw TransferError(Fault::storage_unavailable, "blob shorter than recorded");
        }
        at += got;
    }
    return SecureBlob(std::move(out));
}

bool TransferRegistry::purge(const std::string& id) {
    std::optional<BlobRecord> blob;
    {
        std::scoped_lock lock(mu_);
        auto* rec = store_.find(id);
        if (!rec) {
            return true;
        }
        if (rec->in_flight) {
            return false;
        }
        spdlog::debug("purging transfer {} in state {}", log::id_tag(id), state_name(rec->state));
        if (rec->state == State::active) {
            rec->state = State::expired;
        }
        if (!rec->blob || rec->blob->purged) {
            static_cast<void>(store_.erase(id));
            return true;
        }
        rec->in_flight = true;
        blob = rec->blob;
    }

    try {
        blobs_.purge(*blob);
    } catch (const TransferError& ex) {
        spdlog::warn("purge of transfer {} failed, will retry: {}", log::id_tag(id), ex.what());
        std::scoped_lock lock(mu_);
        if (auto* rec = store_.find(id)) {
            rec->in_flight = false;
        }
        return false;
    }

    std::scoped_lock lock(mu_);
    static_cast<void>(store_.erase(id));
    return true;
}

SweepReport TransferRegistry::sweep() {
    const auto now = clock_.now_ms();
    SweepReport rep;
    std::vector<std::string> ids;
    {
        std::scoped_lock lock(mu_);
        ids = store_.sweepable(now);
        for (const auto& id : ids) {
            auto* rec = store_.find(id);
            if (rec && rec->state == State::active && rec->due(now)) {
                rec->state = State::expired;
                ++rep.expired;
            }
        }
    }
    for (const auto& id : ids) {
        if (purge(id)) {
            ++rep.purged;
        } else {
            ++rep.failed;
        }
    }
    if (rep.purged > 0 || rep.failed > 0) {
        spdlog::info("sweep: {} expired, {} purged, {} pending", rep.expired, rep.purged, rep.failed);
    }
    return rep;
}

std::size_t TransferRegistry::drain() {
    std::vector<std::string> ids;
    {
        std::scoped_lock lock(mu_);
        ids = store_.ids();
    }
    std::size_t left = 0;
    for (const auto& id : ids) {
        if (!purge(id)) {
            ++left;
        }
    }
    if (!ids.empty()) {
        spdlog::info("drained {} transfer(s), {} pending", ids.size() - left, left);
    }
    return left;
}

std::size_t TransferRegistry::reclaim_orphans() {
    std::unordered_set<std::string> live;
    {
        std::scoped_lock lock(mu_);
        for (const auto& id : store_.ids()) {
            const auto* rec = store_.find(id);
            if (rec && rec->blob && !rec->blob->purged) {
                live.insert(rec->blob->ref);
            }
        }
    }
    const auto gone = blobs_.reclaim(live);
    if (gone > 0) {
        spdlog::info("reclaimed {} orphaned blob(s)", gone);
    }
    return gone;
}

std::size_t TransferRegistry::size() const {
    std::scoped_lock lock(mu_);
    return store_.size();
}

}
