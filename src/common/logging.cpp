// common/logging.cpp
#include "common/logging.h"
#include "core/errors.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <string>

namespace expflow::logging {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get(kLoggerName);
        if (!instance) {
            instance = spdlog::stderr_color_mt(kLoggerName);
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
        }
    });
    return instance;
}

void set_level(std::string_view level) {
    auto parsed = spdlog::level::from_str(std::string(level));
    // from_str maps anything it does not know to "off"
    if (parsed == spdlog::level::off && level != "off") {
        throw ConfigError("Unknown log level: " + std::string(level));
    }
    logger()->set_level(parsed);
}

} // namespace expflow::logging
