#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace burnbox {

std::uint64_t now_ms();

class Clock {
public:
    virtual ~Clock() = default;
    virtual std::uint64_t now_ms() const = 0;
};

class SystemClock : public Clock {
public:
    std::uint64_t now_ms() const override;
};

class ManualClock : public Clock {
public:
    explicit ManualClock(std::uint64_t start_ms = 1'000'000);

    std::uint64_t now_ms() const override;
    void advance(std::chrono::milliseconds by);
    void set(std::uint64_t at_ms);

private:
    std::atomic<std::uint64_t> at_;
};

}
