#include "burnbox/tier_policy.hpp"

#include <stdexcept>
#include <string>

namespace burnbox {
namespace {

constexpr std::uint64_t mib = 1024ULL * 1024ULL;

std::size_t slot_of(Tier tier) {
    const auto at = static_cast<std::size_t>(tier);
    if (at >= tier_count) {
        throw std::invalid_argument("unknown tier");
    }
    return at;
}

}

std::string_view tier_name(Tier tier) {
    switch (tier) {
    case Tier::free:
        return "free";
    case Tier::premium:
        return "premium";
    }
    return "unknown";
}

std::optional<Tier> tier_from_name(std::string_view name) {
    if (name == "free") {
        return Tier::free;
    }
    if (name == "premium") {
        return Tier::premium;
    }
    return std::nullopt;
}

TierLimits default_limits(Tier tier) {
    using namespace std::chrono_literals;
    switch (tier) {
    case Tier::free:
        return TierLimits{50 * mib, 5, 1h, 15min};
    case Tier::premium:
        return TierLimits{1024 * mib, 20, 1h, 15min};
    }
    throw std::invalid_argument("unknown tier");
}

void validate(const TierLimits& limits) {
    if (limits.max_content_size == 0) {
        throw std::invalid_argument("tier max content size must be positive");
    }
    if (limits.max_transfers_per_window == 0) {
        throw std::invalid_argument("tier transfer quota must be positive");
    }
    if (limits.window.count() <= 0) {
        throw std::invalid_argument("tier quota window must be positive");
    }
    if (limits.expiry.count() <= 0) {
        throw std::invalid_argument("tier expiry must be positive");
    }
}

TierPolicy::TierPolicy() : table_{default_limits(Tier::free), default_limits(Tier::premium)} {}

void TierPolicy::set(Tier tier, const TierLimits& limits) {
    validate(limits);
    table_[slot_of(tier)] = limits;
}

const TierLimits& TierPolicy::limits(Tier tier) const {
    return table_[slot_of(tier)];
}

}
