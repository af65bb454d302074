#include "burnbox/clock.hpp"

namespace burnbox {

std::uint64_t now_ms() {
    const auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return static_cast<std::uint64_t>(now.time_since_epoch().count());
}

std::uint64_t SystemClock::now_ms() const {
    return burnbox::now_ms();
}

ManualClock::ManualClock(std::uint64_t start_ms) : at_(start_ms) {}

std::uint64_t ManualClock::now_ms() const {
    return at_.load();
}

void ManualClock::advance(std::chrono::milliseconds by) {
    at_.fetch_add(static_cast<std::uint64_t>(by.count()));
}

void ManualClock::set(std::uint64_t at_ms) {
    at_.store(at_ms);
}

}
