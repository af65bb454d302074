#include "burnbox/config.hpp"

#include <stdexcept>
#include <string>

namespace burnbox {

TierLimits& EngineConfig::limits(Tier tier) {
    return tiers.at(static_cast<std::size_t>(tier));
}

const TierLimits& EngineConfig::limits(Tier tier) const {
    return tiers.at(static_cast<std::size_t>(tier));
}

void EngineConfig::validate() const {
    for (std::size_t i = 0; i < tiers.size(); ++i) {
        try {
            burnbox::validate(tiers[i]);
        } catch (const std::invalid_argument& ex) {
            throw std::invalid_argument(std::string(tier_name(static_cast<Tier>(i))) + " " + ex.what());
        }
    }
    if (reaper_interval.count() <= 0) {
        throw std::invalid_argument("reaper interval must be positive");
    }
    if (max_password_attempts == 0) {
        throw std::invalid_argument("max password attempts must be positive");
    }
    if (kdf_iterations < 1000) {
        throw std::invalid_argument("kdf iterations must be at least 1000");
    }
    for (const auto& id : admin_ids) {
        if (id.empty()) {
            throw std::invalid_argument("admin id cannot be empty");
        }
    }
}

}
