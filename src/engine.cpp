#include "burnbox/engine.hpp"

#include "burnbox/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace burnbox {
namespace {

constexpr std::size_t read_chunk = 64 * 1024;

EngineConfig validated(EngineConfig config) {
    config.validate();
    return config;
}

TierPolicy policy_from(const EngineConfig& config) {
    TierPolicy policy;
    for (std::size_t i = 0; i < tier_count; ++i) {
        policy.set(static_cast<Tier>(i), config.tiers[i]);
    }
    return policy;
}

std::unique_ptr<BlobStore> blob_store_for(const EngineConfig& config, const TierPolicy& policy) {
    if (config.blob_dir.empty()) {
        return std::make_unique<MemoryBlobStore>(policy);
    }
    return std::make_unique<DiskBlobStore>(config.blob_dir, policy);
}

}

TransferEngine::TransferEngine(EngineConfig config, const Clock& clock, std::unique_ptr<TransferStore> store)
    : config_(validated(std::move(config))),
      clock_(clock),
      policy_(policy_from(config_)),
      store_(store ? std::move(store) : std::make_unique<MemoryTransferStore>()),
      blobs_(blob_store_for(config_, policy_)),
      quota_(policy_),
      crypto_(config_.kdf_iterations),
      users_(config_.admin_ids),
      registry_(*store_, *blobs_, quota_, policy_, crypto_, clock_, config_.max_password_attempts),
      reaper_(registry_, config_.reaper_interval) {
    spdlog::info("transfer engine ready: blobs in {}, {} admin(s)", config_.blob_dir.empty() ? std::string("memory") : config_.blob_dir.string(),
                 config_.admin_ids.size());
    static_cast<void>(registry_.reclaim_orphans());
    if (config_.run_reaper) {
        reaper_.start();
    }
}

TransferEngine::~TransferEngine() {
    reaper_.stop();
}

const Clock& TransferEngine::default_clock() {
    static const SystemClock clock;
    return clock;
}

Tier TransferEngine::effective_tier(const std::string& user_id, Tier tier) {
    return users_.touch(user_id, tier, clock_.now_ms()).tier;
}

Receipt TransferEngine::create_transfer(const std::string& user_id, Tier tier, Kind kind, std::span<const std::uint8_t> content,
                                        std::optional<std::string> password, std::string file_name, std::stop_token stop) {
    CreateRequest req;
    req.owner = user_id;
    req.tier = effective_tier(user_id, tier);
    req.kind = kind;
    req.content = content;
    req.password = std::move(password);
    req.file_name = std::move(file_name);
    req.quota_exempt = users_.is_admin(user_id);

    const Ticket ticket = registry_.create(req, stop);
    users_.count_transfer(user_id);
    return Receipt{ticket.id, ticket.expires_at};
}

Receipt TransferEngine::create_text_transfer(const std::string& user_id, Tier tier, std::string_view text, std::optional<std::string> password) {
    const std::span<const std::uint8_t> bytes(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    return create_transfer(user_id, tier, Kind::text, bytes, std::move(password));
}

Receipt TransferEngine::create_file_transfer(const std::string& user_id, Tier tier, std::istream& in, std::uint64_t size, std::string file_name,
                                             std::optional<std::string> password, std::stop_token stop) {
    const Tier eff = effective_tier(user_id, tier);
    if (size > policy_.limits(eff).max_content_size) {
        spdlog::info("file from {} rejected: {} bytes over the {} limit", user_id, size, tier_name(eff));
        throw TransferError(Fault::size_limit_exceeded);
    }
    if (size == 0) {
        throw std::invalid_argument("file is empty");
    }
    if (!users_.is_admin(user_id)) {
        const Usage u = quota_.usage(user_id, eff, clock_.now_ms());
        if (u.used >= u.limit) {
            throw TransferError(Fault::quota_exceeded);
        }
    }

    std::vector<std::uint8_t> buf(static_cast<std::size_t>(size));
    std::size_t at = 0;
    while (at < buf.size()) {
        if (stop.stop_requested()) {
            zero(buf);
            throw TransferError(Fault::canceled);
        }
        const auto want = std::min(buf.size() - at, read_chunk);
        in.read(reinterpret_cast<char*>(buf.data() + at), static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0) {
            zero(buf);
            throw std::invalid_argument("file stream shorter than declared size");
        }
        at += got;
    }
    if (in.peek() != std::char_traits<char>::eof()) {
        zero(buf);
        throw TransferError(Fault::size_limit_exceeded, "file stream longer than declared size");
    }

    const SecureBlob body(std::move(buf));
    return create_transfer(user_id, eff, Kind::file, body.view(), std::move(password), std::move(file_name), stop);
}

Delivery TransferEngine::retrieve_transfer(const std::string& transfer_id, std::optional<std::string_view> password, std::stop_token stop) {
    return registry_.retrieve(transfer_id, password, stop);
}

Preview TransferEngine::peek_transfer(const std::string& transfer_id) {
    return registry_.peek(transfer_id);
}

Usage TransferEngine::get_usage(const std::string& user_id, Tier tier) {
    return quota_.usage(user_id, effective_tier(user_id, tier), clock_.now_ms());
}

const TierLimits& TransferEngine::get_tier_limits(Tier tier) const {
    return policy_.limits(tier);
}

UserStats TransferEngine::user_stats(const std::string& user_id) {
    const auto now = clock_.now_ms();
    const UserRecord rec = users_.touch(user_id, Tier::free, now);
    const Usage u = quota_.usage(user_id, rec.tier, now);

    UserStats out{};
    out.tier = rec.tier;
    out.admin = rec.admin;
    out.used = u.used;
    out.limit = u.limit;
    out.remaining = u.limit > u.used ? u.limit - u.used : 0;
    out.total_transfers = rec.total_transfers;
    out.max_content_size = policy_.limits(rec.tier).max_content_size;
    out.resets_at_ms = u.resets_at_ms;
    return out;
}

void TransferEngine::set_tier(const std::string& user_id, Tier tier) {
    users_.set_tier(user_id, tier, clock_.now_ms());
    spdlog::info("user {} now on {} tier", user_id, tier_name(tier));
}

std::size_t TransferEngine::live_transfers() const {
    return registry_.size();
}

TransferRegistry& TransferEngine::registry() {
    return registry_;
}

ExpiryReaper& TransferEngine::reaper() {
    return reaper_;
}

BlobStore& TransferEngine::blobs() {
    return *blobs_;
}

}
