#include "burnbox/expiry_reaper.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>

namespace burnbox {

ExpiryReaper::ExpiryReaper(TransferRegistry& registry, std::chrono::milliseconds interval) : registry_(registry), interval_(interval) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("reaper interval must be positive");
    }
}

ExpiryReaper::~ExpiryReaper() {
    stop();
}

void ExpiryReaper::start() {
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::jthread([this](std::stop_token st) { loop(st); });
    spdlog::info("expiry reaper started, interval {} ms", interval_.count());
}

void ExpiryReaper::stop() {
    if (!worker_.joinable()) {
        return;
    }
    worker_.request_stop();
    worker_.join();
    spdlog::info("expiry reaper stopped after {} sweeps", ticks_.load());
}

bool ExpiryReaper::running() const {
    return worker_.joinable();
}

std::uint64_t ExpiryReaper::ticks() const {
    return ticks_.load();
}

SweepReport ExpiryReaper::run_once() {
    SweepReport rep;
    try {
        rep = registry_.sweep();
    } catch (const std::exception& ex) {
        spdlog::error("sweep aborted, retrying next tick: {}", ex.what());
    }
    ++ticks_;
    return rep;
}

void ExpiryReaper::loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(mu_);
            static_cast<void>(cv_.wait_for(lock, stop, interval_, [] { return false; }));
        }
        if (stop.stop_requested()) {
            break;
        }
        static_cast<void>(run_once());
    }
}

}
