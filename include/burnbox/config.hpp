#pragma once

#include "burnbox/key_wrap.hpp"
#include "burnbox/tier_policy.hpp"
#include "burnbox/transfer_registry.hpp"

#include <spdlog/common.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace burnbox {

struct EngineConfig {
    std::array<TierLimits, tier_count> tiers{default_limits(Tier::free), default_limits(Tier::premium)};
    std::chrono::milliseconds reaper_interval{std::chrono::seconds(30)};
    std::uint32_t max_password_attempts = default_password_attempts;
    std::uint32_t kdf_iterations = default_kdf_iterations;
    std::filesystem::path blob_dir;
    std::vector<std::string> admin_ids;
    spdlog::level::level_enum log_level = spdlog::level::info;
    bool run_reaper = true;

    TierLimits& limits(Tier tier);
    const TierLimits& limits(Tier tier) const;

    void validate() const;
};

}
