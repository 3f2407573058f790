#include "exec_kernel/logging.h"

#include <mutex>
#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace exec_kernel {

namespace {

constexpr const char* kLoggerName = "exec_kernel";

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::mutex mtx;
    static std::shared_ptr<spdlog::logger> instance;

    std::lock_guard<std::mutex> lock(mtx);
    if (!instance) {
        instance = spdlog::get(kLoggerName);
        if (!instance) {
            instance = spdlog::stderr_color_mt(kLoggerName);
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [tid %t] %v");
        }
    }
    return instance;
}

void set_log_level(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && level != "off") {
        throw std::invalid_argument("unknown log level: " + level);
    }
    logger()->set_level(lvl);
}

} // namespace exec_kernel
