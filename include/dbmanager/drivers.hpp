/**
 * @file drivers.hpp
 * @brief Drivers shipped with the library
 *
 * The sqlite3 driver is always available. The duckdb and mysql drivers are
 * compiled in when their client libraries were found at configure time;
 * builtinDriverNames() reports what this build contains.
 *
 * Engine libraries stay out of these headers: each driver's connection
 * type lives in its own source file.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "driver.hpp"

namespace dbmanager {

/**
 * @brief SQLite 3 through the C API
 *
 * DSN: <path>[?params]. Recognized parameters:
 *   _journal_mode=<mode>   PRAGMA journal_mode on read-write connections
 *   _busy_timeout=<ms>     sqlite3_busy_timeout (default 5000)
 *   _foreign_keys=1|0      PRAGMA foreign_keys
 *   mode=ro|rw|rwc|memory  open flags (default rwc)
 * Other parameters are ignored.
 */
class Sqlite3Driver : public Driver {
public:
    std::string name() const override { return "sqlite3"; }
    std::unique_ptr<DriverConnection> open(const std::string& dsn) override;
};

#ifdef DBMANAGER_HAVE_DUCKDB
/**
 * @brief DuckDB through the C API
 *
 * DSN: <path>[?access_mode=read_only|read_write]. An empty path or
 * ":memory:" opens an in-memory database.
 */
class DuckDBDriver : public Driver {
public:
    std::string name() const override { return "duckdb"; }
    std::unique_ptr<DriverConnection> open(const std::string& dsn) override;
};
#endif

#ifdef DBMANAGER_HAVE_MYSQL
/**
 * @brief MySQL / MariaDB through libmysqlclient
 *
 * DSN: see parseMySqlDsn().
 */
class MySQLDriver : public Driver {
public:
    std::string name() const override { return "mysql"; }
    std::unique_ptr<DriverConnection> open(const std::string& dsn) override;
};
#endif

/**
 * @brief Names of the drivers compiled into this build
 */
std::vector<std::string> builtinDriverNames();

/**
 * @brief Register every built-in driver not already present in @p registry
 * @return Names that were newly registered
 */
std::vector<std::string> registerBuiltinDrivers(
    const std::shared_ptr<DriverRegistry>& registry = DriverRegistry::global());

} // namespace dbmanager
