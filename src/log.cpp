#include "burnbox/log.hpp"

#include "burnbox/cipher_rig.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <span>

namespace burnbox::log {

void init(spdlog::level::level_enum level, const std::string& path) {
    std::shared_ptr<spdlog::logger> logger;
    if (path.empty()) {
        logger = std::make_shared<spdlog::logger>("burnbox", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    } else {
        logger = std::make_shared<spdlog::logger>("burnbox", std::make_shared<spdlog::sinks::basic_file_sink_mt>(path));
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
}

std::string id_tag(const std::string& id) {
    const auto digest = sha256_of(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(id.data()), id.size()));
    return hex_of(std::span<const std::uint8_t>(digest.data(), 4));
}

}
