#pragma once

#include "burnbox/blob_store.hpp"
#include "burnbox/clock.hpp"
#include "burnbox/config.hpp"
#include "burnbox/crypto_box.hpp"
#include "burnbox/expiry_reaper.hpp"
#include "burnbox/quota_tracker.hpp"
#include "burnbox/tier_policy.hpp"
#include "burnbox/transfer_registry.hpp"
#include "burnbox/transfer_store.hpp"
#include "burnbox/user_directory.hpp"

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace burnbox {

struct Receipt {
    std::string transfer_id;
    std::uint64_t expires_at;
};

struct UserStats {
    Tier tier;
    bool admin;
    std::uint32_t used;
    std::uint32_t limit;
    std::uint32_t remaining;
    std::uint64_t total_transfers;
    std::uint64_t max_content_size;
    std::optional<std::uint64_t> resets_at_ms;
};

class TransferEngine {
public:
    explicit TransferEngine(EngineConfig config, const Clock& clock = default_clock(), std::unique_ptr<TransferStore> store = nullptr);
    ~TransferEngine();
    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    Receipt create_transfer(const std::string& user_id, Tier tier, Kind kind, std::span<const std::uint8_t> content, std::optional<std::string> password = std::nullopt,
                            std::string file_name = {}, std::stop_token stop = {});
    Receipt create_text_transfer(const std::string& user_id, Tier tier, std::string_view text, std::optional<std::string> password = std::nullopt);
    Receipt create_file_transfer(const std::string& user_id, Tier tier, std::istream& in, std::uint64_t size, std::string file_name,
                                 std::optional<std::string> password = std::nullopt, std::stop_token stop = {});

    Delivery retrieve_transfer(const std::string& transfer_id, std::optional<std::string_view> password = std::nullopt, std::stop_token stop = {});
    Preview peek_transfer(const std::string& transfer_id);

    Usage get_usage(const std::string& user_id, Tier tier);
    const TierLimits& get_tier_limits(Tier tier) const;
    UserStats user_stats(const std::string& user_id);
    void set_tier(const std::string& user_id, Tier tier);

    std::size_t live_transfers() const;
    TransferRegistry& registry();
    ExpiryReaper& reaper();
    BlobStore& blobs();

    static const Clock& default_clock();

private:
    Tier effective_tier(const std::string& user_id, Tier tier);

    EngineConfig config_;
    const Clock& clock_;
    TierPolicy policy_;
    std::unique_ptr<TransferStore> store_;
    std::unique_ptr<BlobStore> blobs_;
    QuotaTracker quota_;
    CryptoBox crypto_;
    UserDirectory users_;
    TransferRegistry registry_;
    ExpiryReaper reaper_;
};

}
