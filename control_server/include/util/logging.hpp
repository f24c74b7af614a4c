#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace academy::util::log {

void init(const std::string& level, const std::string& file_path);

inline void debug(const std::string& message) { spdlog::debug(message); }
inline void info(const std::string& message) { spdlog::info(message); }
inline void warn(const std::string& message) { spdlog::warn(message); }
inline void error(const std::string& message) { spdlog::error(message); }

}  // namespace academy::util::log
