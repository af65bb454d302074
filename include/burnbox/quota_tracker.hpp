#pragma once

#include "burnbox/tier_policy.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace burnbox {

struct Usage {
    std::uint32_t used;
    std::uint32_t limit;
    std::optional<std::uint64_t> resets_at_ms;
};

class QuotaTracker {
public:
    explicit QuotaTracker(const TierPolicy& policy);

    bool admit(const std::string& user, Tier tier, std::uint64_t now);
    void refund(const std::string& user, std::uint64_t now);
    Usage usage(const std::string& user, Tier tier, std::uint64_t now) const;

private:
    struct Window {
        std::uint64_t start;
        std::uint64_t span;
        std::uint32_t used;
    };

    static bool open_at(const Window& w, std::uint64_t now);

    const TierPolicy& policy_;
    std::unordered_map<std::string, Window> slots_;
    mutable std::mutex mu_;
};

}
