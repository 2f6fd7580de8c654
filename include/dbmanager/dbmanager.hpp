/**
 * @file dbmanager.hpp
 * @brief Main include file for the dbmanager library
 *
 * INDUSTRY PRACTICE #8: Single Include Header
 * ===========================================
 * Users can either:
 *   #include <dbmanager/dbmanager.hpp>  // Everything except spdlog/YAML glue
 * Or include specific headers for faster compilation:
 *   #include <dbmanager/manager.hpp>
 *
 * ============================================================
 * DBMANAGER LIBRARY - Summary
 * ============================================================
 *
 * 1.  One entry point, three engines
 *     - DuckDB (embedded analytical), SQLite (embedded row store),
 *       MySQL (network relational)
 *     - Engine-specific connection strings built in one place
 *
 * 2.  Bounded retries with linear backoff
 *     - 8 attempts, 400 ms base by default
 *     - Cancellable through Context
 *
 * 3.  Self-healing read-only DuckDB opens
 *     - One WAL checkpoint per call when a read-only open fails
 *
 * 4.  Single-connection handles
 *     - No idle connections, so file locks are released promptly
 *
 * 5.  Pluggable drivers
 *     - Registered by name; tests register fakes
 *
 * ============================================================
 *
 * logging.hpp (spdlog) and config.hpp (yaml-cpp) are included separately.
 */

#pragma once

#include "exceptions.hpp"
#include "options.hpp"
#include "logger.hpp"
#include "context.hpp"
#include "driver.hpp"
#include "database.hpp"
#include "dsn.hpp"
#include "sqlite_resolver.hpp"
#include "opener.hpp"
#include "manager.hpp"
#include "drivers.hpp"

namespace dbmanager {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

} // namespace dbmanager
