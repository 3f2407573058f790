#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace exec_kernel {

/// Library-wide logger named "exec_kernel". Created on first use, writing to
/// stderr unless the application registered its own logger under that name.
std::shared_ptr<spdlog::logger> logger();

/// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
/// Throws std::invalid_argument on an unknown name.
void set_log_level(const std::string& level);

} // namespace exec_kernel
