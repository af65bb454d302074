#include "burnbox/quota_tracker.hpp"
#include "burnbox/tier_policy.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

constexpr std::uint64_t t0 = 5'000'000;
constexpr std::uint64_t hour_ms = 3'600'000;

void need(bool ok, const std::string& msg) {
    if (!ok) {
        throw std::runtime_error(msg);
    }
}

void default_tiers() {
    const burnbox::TierPolicy policy;
    const auto& f = policy.limits(burnbox::Tier::free);
    const auto& p = policy.limits(burnbox::Tier::premium);
    need(f.max_content_size == 50ULL * 1024 * 1024, "free size limit");
    need(f.max_transfers_per_window == 5, "free quota");
    need(p.max_content_size == 1024ULL * 1024 * 1024, "premium size limit");
    need(p.max_transfers_per_window == 20, "premium quota");
    need(f.window == 1h && p.window == 1h, "quota window");
    need(f.expiry == 15min && p.expiry == 15min, "expiry");
}

void tier_names() {
    need(burnbox::tier_name(burnbox::Tier::premium) == "premium", "tier name");
    need(burnbox::tier_from_name("free") == burnbox::Tier::free, "tier parse");
    need(!burnbox::tier_from_name("gold"), "unknown tier parsed");
}

void bad_limits_rejected() {
    burnbox::TierPolicy policy;
    auto lim = burnbox::default_limits(burnbox::Tier::free);
    lim.max_transfers_per_window = 0;
    bool hit = false;
    try {
        policy.set(burnbox::Tier::free, lim);
    } catch (const std::invalid_argument&) {
        hit = true;
    }
    need(hit, "zero quota accepted");
    need(policy.limits(burnbox::Tier::free).max_transfers_per_window == 5, "rejected limits were applied");

    lim = burnbox::default_limits(burnbox::Tier::free);
    lim.expiry = 0ms;
    hit = false;
    try {
        burnbox::validate(lim);
    } catch (const std::invalid_argument&) {
        hit = true;
    }
    need(hit, "zero expiry accepted");
}

void admits_up_to_limit() {
    const burnbox::TierPolicy policy;
    burnbox::QuotaTracker quota(policy);
    for (int i = 0; i < 5; ++i) {
        need(quota.admit("u1", burnbox::Tier::free, t0 + static_cast<std::uint64_t>(i)), "admission within quota refused");
    }
    need(!quota.admit("u1", burnbox::Tier::free, t0 + 10), "sixth admission allowed");
    need(quota.admit("u2", burnbox::Tier::free, t0 + 10), "quota leaked across users");

    const auto u = quota.usage("u1", burnbox::Tier::free, t0 + 10);
    need(u.used == 5 && u.limit == 5, "usage counts");
    need(u.resets_at_ms && *u.resets_at_ms == t0 + hour_ms, "reset time");
}

void window_resets() {
    const burnbox::TierPolicy policy;
    burnbox::QuotaTracker quota(policy);
    for (int i = 0; i < 5; ++i) {
        need(quota.admit("u1", burnbox::Tier::free, t0), "fill window");
    }
    need(!quota.admit("u1", burnbox::Tier::free, t0 + hour_ms - 1), "window closed early");
    need(quota.admit("u1", burnbox::Tier::free, t0 + hour_ms), "window did not reset");
    need(quota.usage("u1", burnbox::Tier::free, t0 + hour_ms).used == 1, "fresh window count");
}

void idle_user_has_no_window() {
    const burnbox::TierPolicy policy;
    const burnbox::QuotaTracker quota(policy);
    const auto u = quota.usage("ghost", burnbox::Tier::premium, t0);
    need(u.used == 0 && u.limit == 20, "idle usage");
    need(!u.resets_at_ms, "idle user has a reset time");
}

void refund_returns_slot() {
    const burnbox::TierPolicy policy;
    burnbox::QuotaTracker quota(policy);
    for (int i = 0; i < 5; ++i) {
        need(quota.admit("u1", burnbox::Tier::free, t0), "fill window");
    }
    quota.refund("u1", t0 + 1);
    need(quota.usage("u1", burnbox::Tier::free, t0 + 1).used == 4, "refund not applied");
    need(quota.admit("u1", burnbox::Tier::free, t0 + 2), "refunded slot unusable");

    quota.refund("nobody", t0);
    quota.refund("u1", t0 + hour_ms * 2);
    need(quota.usage("u1", burnbox::Tier::free, t0 + 3).used == 5, "refund outside window touched count");
}

void concurrent_admission_is_exact() {
    const burnbox::TierPolicy policy;
    burnbox::QuotaTracker quota(policy);
    std::atomic<int> admitted{0};
    std::vector<std::thread> pool;
    for (int i = 0; i < 16; ++i) {
        pool.emplace_back([&] {
            for (int j = 0; j < 4; ++j) {
                if (quota.admit("busy", burnbox::Tier::premium, t0)) {
                    ++admitted;
                }
            }
        });
    }
    for (auto& t : pool) {
        t.join();
    }
    need(admitted.load() == 20, "concurrent admissions exceeded quota");
}

}

int main() {
    try {
        default_tiers();
        tier_names();
        bad_limits_rejected();
        admits_up_to_limit();
        window_resets();
        idle_user_has_no_window();
        refund_returns_slot();
        concurrent_admission_is_exact();
        std::cout << "quota tracker tests passed\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }
}
