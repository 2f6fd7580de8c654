/**
 * @file logging.hpp
 * @brief spdlog integration for the Logger callback
 *
 * The core library only knows the Logger callback. Applications that log
 * with spdlog wire it in here:
 *   auto log = dbmanager::initLogging("dbmanager", spdlog::level::info);
 *   DBManager manager(Engine::SQLite, dbmanager::spdlogLogger(log));
 */

#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "logger.hpp"

namespace dbmanager {

/**
 * @brief Forward every line to @p logger at @p level
 *
 * The returned callback keeps @p logger alive. spdlog loggers built with
 * *_mt sinks are safe to call from several threads.
 */
Logger spdlogLogger(std::shared_ptr<spdlog::logger> logger,
                    spdlog::level::level_enum level = spdlog::level::warn);

/**
 * @brief Create (or fetch) a colored stdout logger named @p name
 *
 * Registers it with spdlog and makes it the default logger.
 */
std::shared_ptr<spdlog::logger> initLogging(const std::string& name,
                                            spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Parse "trace", "debug", "info", "warn", "error", "critical", "off"
 * @throws ConfigException for anything else
 */
spdlog::level::level_enum parseLogLevel(const std::string& name);

} // namespace dbmanager
