/**
 * @file logger.hpp
 * @brief Diagnostic sink injected into the manager
 *
 * The library never writes to stdout or a log file on its own. Every
 * diagnostic line (failed attempt, checkpoint outcome) goes through a
 * Logger supplied by the embedding application. See logging.hpp for the
 * spdlog adapter.
 *
 * Nothing here serializes calls: a Logger shared between threads must be
 * thread-safe itself.
 */

#pragma once

#include <functional>
#include <string>

namespace dbmanager {

using Logger = std::function<void(const std::string&)>;

/**
 * @brief Shared logger that discards everything
 *
 * Substituted for an empty Logger at construction so call sites never
 * need to check.
 */
const Logger& noopLogger();

} // namespace dbmanager
