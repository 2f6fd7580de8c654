/**
 * @file config.hpp
 * @brief YAML configuration for named databases
 *
 * Example:
 *   default_engine: sqlite
 *   log_level: info
 *   databases:
 *     analytics:
 *       engine: duckdb
 *       path: data/analytics.duckdb
 *       mode: read_only
 *       max_retries: 3
 *       retry_base_ms: 100
 *     store:
 *       path: data/store.db
 *
 * Omitted keys keep the OpenOptions defaults. Unknown keys are ignored.
 */

#pragma once

#include <map>
#include <string>
#include "options.hpp"

namespace dbmanager {

struct ManagerConfig {
    Engine defaultEngine = Engine::SQLite;
    std::string logLevel = "info";
    std::map<std::string, OpenOptions> databases;
};

/**
 * @throws ConfigException if the file cannot be read or is invalid
 */
ManagerConfig loadManagerConfig(const std::string& path);

/**
 * @throws ConfigException if @p yaml is invalid
 */
ManagerConfig parseManagerConfig(const std::string& yaml);

} // namespace dbmanager
