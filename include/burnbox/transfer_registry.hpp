#pragma once

#include "burnbox/blob_store.hpp"
#include "burnbox/clock.hpp"
#include "burnbox/crypto_box.hpp"
#include "burnbox/quota_tracker.hpp"
#include "burnbox/tier_policy.hpp"
#include "burnbox/transfer.hpp"
#include "burnbox/transfer_store.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace burnbox {

inline constexpr std::uint32_t default_password_attempts = 5;

struct CreateRequest {
    std::string owner;
    Tier tier = Tier::free;
    Kind kind = Kind::text;
    std::span<const std::uint8_t> content;
    std::optional<std::string> password;
    std::string file_name;
    bool quota_exempt = false;
};

struct Ticket {
    std::string id;
    std::uint64_t expires_at;
};

struct Delivery {
    Kind kind;
    SecureBlob content;
    std::string file_name;
};

struct Preview {
    Kind kind;
    bool password_protected;
    std::uint64_t size;
    std::string file_name;
    std::uint64_t expires_at;
};

struct SweepReport {
    std::size_t expired = 0;
    std::size_t purged = 0;
    std::size_t failed = 0;
};

class TransferRegistry {
public:
    TransferRegistry(TransferStore& store, BlobStore& blobs, QuotaTracker& quota, const TierPolicy& policy, const CryptoBox& crypto, const Clock& clock,
                     std::uint32_t max_password_attempts = default_password_attempts);
    ~TransferRegistry();
    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    Ticket create(const CreateRequest& req, std::stop_token stop = {});
    Delivery retrieve(const std::string& id, std::optional<std::string_view> password, std::stop_token stop = {});
    Preview peek(const std::string& id);

    bool purge(const std::string& id);
    SweepReport sweep();
    std::size_t drain();
    std::size_t reclaim_orphans();

    std::size_t size() const;

private:
    struct Claim {
        Kind kind;
        Packet packet;
        std::optional<BlobRecord> blob;
        std::string file_name;
        std::uint64_t expires_at;
    };

    std::string fresh_id() const;
    Claim claim(const std::string& id);
    void unclaim(const std::string& id);
    void release_claim(const std::string& id);
    void note_wrong_password(const std::string& id);
    [[noreturn]] void expire_now(const std::string& id);
    SecureBlob read_blob(const BlobRecord& blob, std::stop_token stop);

    TransferStore& store_;
    BlobStore& blobs_;
    QuotaTracker& quota_;
    const TierPolicy& policy_;
    const CryptoBox& crypto_;
    const Clock& clock_;
    std::uint32_t max_attempts_;
    mutable std::mutex mu_;
};

}
