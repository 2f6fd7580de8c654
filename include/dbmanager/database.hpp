/**
 * @file database.hpp
 * @brief Caller-owned database handle with a bounded connection pool
 *
 * INDUSTRY PRACTICE #5: RAII Handles
 * ==================================
 * A Database owns every connection it opened. Destroying it (or calling
 * close()) closes them, which for the embedded engines releases the OS file
 * lock. Handles are non-copyable and are handed out as unique_ptr so
 * ownership is never ambiguous.
 *
 * INDUSTRY PRACTICE #6: Lazy Connections
 * ======================================
 * Constructing a Database does not touch the engine. The first ping() or
 * execute() opens a connection through the driver; that is where lock
 * contention and bad credentials show up.
 */

#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "driver.hpp"

namespace dbmanager {

class Database {
public:
    /**
     * @param driver Driver that opens the connections
     * @param dsn Connection string handed to the driver unchanged
     */
    Database(std::shared_ptr<Driver> driver, std::string dsn);

    // Closes every connection still owned by the pool
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Limit the number of connections kept open while unused
     *
     * Negative values are treated as 0. Excess idle connections are closed
     * immediately.
     */
    void setMaxIdleConns(int n);

    /**
     * @brief Limit the number of connections open at once
     *
     * 0 or negative means unlimited. Lowers the idle limit to match if it
     * would otherwise exceed the open limit.
     */
    void setMaxOpenConns(int n);

    int maxIdleConns() const;
    int maxOpenConns() const;

    int openConnections() const;
    int idleConnections() const;

    /**
     * @brief Verify the engine is reachable, opening a connection if needed
     * @throws ConnectionException if it is not
     */
    void ping();

    /**
     * @throws QueryException if the statement fails
     * @throws ConnectionException if no connection could be opened
     */
    void execute(const std::string& sql);

    /**
     * @brief Run @p fn with a pooled connection
     *
     * Blocks while the open limit is reached. A connection whose call threw
     * ConnectionException is discarded rather than returned to the pool.
     */
    void withConnection(const std::function<void(DriverConnection&)>& fn);

    /**
     * @brief Close idle connections and refuse further use
     *
     * Connections currently in use are closed when they are released.
     * Safe to call more than once.
     */
    void close();

    bool isClosed() const;

    const std::string& dsn() const { return dsn_; }

    std::string driverName() const;

private:
    std::unique_ptr<DriverConnection> acquire();
    void release(std::unique_ptr<DriverConnection> conn, bool reusable);

    std::shared_ptr<Driver> driver_;
    std::string dsn_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<DriverConnection>> idle_;
    int numOpen_ = 0;
    int maxIdle_ = 2;
    int maxOpen_ = 0;
    bool closed_ = false;
};

/**
 * @brief Shape a fresh handle to hold a single connection and no idle ones
 *
 * With no idle connections the file lock of an embedded engine is dropped
 * as soon as a call returns, so other processes retrying the same file are
 * not starved by a pooled connection.
 */
void applyPoolShape(Database& db);

} // namespace dbmanager
