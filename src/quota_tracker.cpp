#include "burnbox/quota_tracker.hpp"

namespace burnbox {

QuotaTracker::QuotaTracker(const TierPolicy& policy) : policy_(policy) {}

bool QuotaTracker::open_at(const Window& w, std::uint64_t now) {
    return w.span != 0 && now >= w.start && now - w.start < w.span;
}

bool QuotaTracker::admit(const std::string& user, Tier tier, std::uint64_t now) {
    const auto& lim = policy_.limits(tier);
    std::scoped_lock lock(mu_);
    auto& w = slots_[user];
    if (!open_at(w, now)) {
        w.start = now;
        w.span = static_cast<std::uint64_t>(lim.window.count());
        w.used = 0;
    }
    if (w.used >= lim.max_transfers_per_window) {
        return false;
    }
    ++w.used;
    return true;
}

void QuotaTracker::refund(const std::string& user, std::uint64_t now) {
    std::scoped_lock lock(mu_);
    const auto it = slots_.find(user);
    if (it == slots_.end()) {
        return;
    }
    auto& w = it->second;
    if (open_at(w, now) && w.used > 0) {
        --w.used;
    }
}

Usage QuotaTracker::usage(const std::string& user, Tier tier, std::uint64_t now) const {
    const auto& lim = policy_.limits(tier);
    Usage out{0, lim.max_transfers_per_window, std::nullopt};
    std::scoped_lock lock(mu_);
    const auto it = slots_.find(user);
    if (it != slots_.end() && open_at(it->second, now)) {
        out.used = it->second.used;
        out.resets_at_ms = it->second.start + it->second.span;
    }
    return out;
}

}
