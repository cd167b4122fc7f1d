#ifndef CORAL_LOG_HPP
#define CORAL_LOG_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace coral {
namespace log {

// Shared "coral" logger, created on first use (stderr, colorized)
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
// Returns false and leaves the level unchanged for an unknown name.
bool set_level(std::string_view level);

} // namespace log
} // namespace coral

#endif // CORAL_LOG_HPP
