/**
 * @file logging.cpp
 * @brief No-op logger and the spdlog adapters
 */

#include "dbmanager/logging.hpp"
#include "dbmanager/exceptions.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace dbmanager {

const Logger& noopLogger() {
    static const Logger instance = [](const std::string&) {};
    return instance;
}

Logger spdlogLogger(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level) {
    if (!logger) {
        return noopLogger();
    }
    return [logger, level](const std::string& line) {
        logger->log(level, "{}", line);
    };
}

std::shared_ptr<spdlog::logger> initLogging(const std::string& name, spdlog::level::level_enum level) {
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(name);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
    }
    logger->set_level(level);
    return logger;
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off; only accept "off" when asked for
    if (level == spdlog::level::off && name != "off") {
        throw ConfigException("unknown log level '" + name + "'");
    }
    return level;
}

} // namespace dbmanager
