/**
 * @file dsn.hpp
 * @brief Connection-string parsing used by the built-in drivers
 *
 * The manager itself never parses a path; only drivers do, each in its own
 * dialect:
 *   SQLite / DuckDB:  <path>[?key=value[&key=value...]]
 *   MySQL:            [user[:password]@][tcp(host[:port])|unix(socket)]/[dbname][?params]
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dbmanager {

using DsnParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief A file path followed by optional query parameters
 */
struct FileDsn {
    std::string path;
    DsnParams params;

    /**
     * @brief Last value given for @p key, if any
     */
    std::optional<std::string> param(const std::string& key) const;

    /**
     * @brief Number of times @p key appears
     */
    int count(const std::string& key) const;
};

/**
 * @brief Split "path?k=v&k2=v2" at the first '?'
 *
 * A parameter without '=' gets an empty value. Empty segments are skipped.
 */
FileDsn parseFileDsn(const std::string& dsn);

struct MySqlDsn {
    std::string user;
    std::string password;
    std::string net = "tcp";      // "tcp" or "unix"
    std::string host = "127.0.0.1";
    unsigned int port = 3306;
    std::string socket;
    std::string database;
    unsigned int connectTimeoutSec = 0;  // 0 = client default
    DsnParams params;
};

/**
 * @throws ConfigException if the DSN is malformed
 */
MySqlDsn parseMySqlDsn(const std::string& dsn);

} // namespace dbmanager
