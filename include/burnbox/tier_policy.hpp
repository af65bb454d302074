#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace burnbox {

enum class Tier : std::uint8_t {
    free = 0,
    premium = 1
};

inline constexpr std::size_t tier_count = 2;

struct TierLimits {
    std::uint64_t max_content_size;
    std::uint32_t max_transfers_per_window;
    std::chrono::milliseconds window;
    std::chrono::milliseconds expiry;
};

std::string_view tier_name(Tier tier);
std::optional<Tier> tier_from_name(std::string_view name);

TierLimits default_limits(Tier tier);
void validate(const TierLimits& limits);

class TierPolicy {
public:
    TierPolicy();

    void set(Tier tier, const TierLimits& limits);
    const TierLimits& limits(Tier tier) const;

private:
    std::array<TierLimits, tier_count> table_;
};

}
