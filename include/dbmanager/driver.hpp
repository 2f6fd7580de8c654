/**
 * @file driver.hpp
 * @brief Driver abstraction and the registry that names drivers
 *
 * INDUSTRY PRACTICE #3: Program to an Interface
 * =============================================
 * The manager never calls sqlite3_open or duckdb_open directly. It asks a
 * Driver, looked up by name, to open a DriverConnection from a connection
 * string. This keeps engine libraries out of the retry logic and lets tests
 * register fake drivers that fail on demand.
 *
 * INDUSTRY PRACTICE #4: Registration by Name
 * ==========================================
 * Drivers are registered by the embedding application before the first
 * open, usually with registerBuiltinDrivers(). The same engine may be
 * served under more than one name ("sqlite" and "sqlite3"); the SQLite
 * resolver picks whichever actually works.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dbmanager {

/**
 * @brief One live connection produced by a Driver
 *
 * Non-copyable. The destructor closes the underlying engine connection.
 */
class DriverConnection {
public:
    DriverConnection() = default;
    virtual ~DriverConnection() = default;

    DriverConnection(const DriverConnection&) = delete;
    DriverConnection& operator=(const DriverConnection&) = delete;

    /**
     * @brief Verify the connection is alive
     * @throws ConnectionException if it is not
     */
    virtual void ping() = 0;

    /**
     * @brief Execute a statement, discarding any result rows
     * @throws QueryException on failure
     */
    virtual void execute(const std::string& sql) = 0;
};

class Driver {
public:
    virtual ~Driver() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Open a new connection
     * @param dsn Engine-specific connection string
     * @throws ConnectionException if the engine refuses it
     */
    virtual std::unique_ptr<DriverConnection> open(const std::string& dsn) = 0;
};

/**
 * @brief Thread-safe name -> Driver table
 */
class DriverRegistry {
public:
    /**
     * @brief The process-wide registry used when nothing else is injected
     */
    static std::shared_ptr<DriverRegistry> global();

    /**
     * @throws DatabaseException if @p name is already registered
     */
    void registerDriver(const std::string& name, std::shared_ptr<Driver> driver);

    /**
     * @brief Register @p driver unless @p name is taken, in one locked step
     * @return true if @p driver was registered
     */
    bool registerIfAbsent(const std::string& name, std::shared_ptr<Driver> driver);

    /**
     * @return true if a driver was removed
     */
    bool unregisterDriver(const std::string& name);

    /**
     * @return The driver, or nullptr when nothing is registered under @p name
     */
    std::shared_ptr<Driver> find(const std::string& name) const;

    bool contains(const std::string& name) const;

    std::vector<std::string> names() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Driver>> drivers_;
};

} // namespace dbmanager
