// =============================================================================
// log.cpp - Component logger
// =============================================================================

#include "coral/log.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace coral {
namespace log {

namespace {
constexpr const char* LOGGER_NAME = "coral";
std::once_flag init_flag;
}

std::shared_ptr<spdlog::logger> logger() {
    std::call_once(init_flag, [] {
        if (!spdlog::get(LOGGER_NAME)) {
            auto l = spdlog::stderr_color_mt(LOGGER_NAME);
            l->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            l->set_level(spdlog::level::info);
        }
    });
    return spdlog::get(LOGGER_NAME);
}

bool set_level(std::string_view level) {
    std::string name(level);
    auto parsed = spdlog::level::from_str(name);
    // from_str maps unknown names to off; only accept "off" when asked for
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

} // namespace log
} // namespace coral
