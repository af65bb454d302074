#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace burnbox::log {

void init(spdlog::level::level_enum level = spdlog::level::info, const std::string& path = "");

std::string id_tag(const std::string& id);

}
