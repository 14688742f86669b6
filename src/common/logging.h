// common/logging.h
#ifndef EXPFLOW_COMMON_LOGGING_H
#define EXPFLOW_COMMON_LOGGING_H

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace expflow::logging {

inline constexpr const char* kLoggerName = "expflow";

// Shared "expflow" logger (stderr, colored). Created on first use.
std::shared_ptr<spdlog::logger> logger();

// "trace" | "debug" | "info" | "warn" | "error" | "critical" | "off"
void set_level(std::string_view level);

} // namespace expflow::logging

#endif // EXPFLOW_COMMON_LOGGING_H
