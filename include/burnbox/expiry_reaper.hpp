#pragma once

#include "burnbox/transfer_registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <thread>

namespace burnbox {

class ExpiryReaper {
public:
    ExpiryReaper(TransferRegistry& registry, std::chrono::milliseconds interval);
    ~ExpiryReaper();
    ExpiryReaper(const ExpiryReaper&) = delete;
    ExpiryReaper& operator=(const ExpiryReaper&) = delete;

    void start();
    void stop();
    bool running() const;

    SweepReport run_once();
    std::uint64_t ticks() const;

private:
    void loop(std::stop_token stop);

    TransferRegistry& registry_;
    std::chrono::milliseconds interval_;
    std::atomic<std::uint64_t> ticks_{0};
    std::mutex mu_;
    std::condition_variable_any cv_;
    std::jthread worker_;
};

}
