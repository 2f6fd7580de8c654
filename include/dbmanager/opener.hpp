/**
 * @file opener.hpp
 * @brief Per-engine "connect with retries" strategies
 *
 * INDUSTRY PRACTICE #7: Strategy Objects in a Lookup Table
 * ========================================================
 * Each engine has its own connection-string dialect and its own failure
 * modes, but the manager only needs one capability from each: "open this".
 * Openers implement that capability and the manager holds them in an
 * OpenerTable keyed by Engine. Supporting another engine means adding an
 * entry, not editing a switch.
 *
 * All openers share the same loop: attempt, shape the pool, ping, and on
 * failure log, sleep (linear backoff) and try again. The DuckDB opener adds
 * a one-shot checkpoint recovery for read-only opens.
 */

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include "context.hpp"
#include "database.hpp"
#include "driver.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "sqlite_resolver.hpp"

namespace dbmanager {

/**
 * @brief Blocks for a backoff delay; returns false if @p ctx fired first
 *
 * Injectable so tests can record delays instead of sleeping.
 */
using Sleeper = std::function<bool(std::chrono::milliseconds, const Context&)>;

/**
 * @brief The real sleeper: Context::sleepFor
 */
Sleeper contextSleeper();

class Opener {
public:
    virtual ~Opener() = default;

    /**
     * @brief Open a handle for @p options
     * @throws RetriesExhaustedException when every attempt failed
     * @throws CancelledException when @p ctx fired first
     */
    virtual std::unique_ptr<Database> open(const OpenOptions& options,
                                           const Context& ctx,
                                           const Logger& logger) = 0;
};

using OpenerTable = std::map<Engine, std::shared_ptr<Opener>>;

/**
 * @brief One run of the shared retry loop
 */
struct RetryRun {
    const char* engine = "";
    std::string path;
    RetryPolicy policy;
    const Context* ctx = nullptr;
    const Logger* logger = nullptr;
    const Sleeper* sleeper = nullptr;

    // Opens a handle; any DatabaseException counts as a failed attempt
    std::function<std::unique_ptr<Database>()> connect;

    // Optional: runs after a failed attempt is logged, before the sleep
    std::function<void(int attempt)> afterFailure;

    // Optional: extra words for the exhausted-retries message
    std::function<std::string()> exhaustedNote;
};

/**
 * @brief Run the attempt/log/sleep loop shared by every opener
 */
std::unique_ptr<Database> connectWithRetries(const RetryRun& run);

/**
 * @brief Look up @p name, build a handle for @p dsn, shape it and ping it
 * @throws ConnectionException on any failure (the handle is closed)
 */
std::unique_ptr<Database> openAndVerify(const DriverRegistry& registry,
                                        const std::string& name,
                                        const std::string& dsn);

// ========== Connection strings ==========

std::string duckdbConnectionString(const std::string& path, AccessMode mode);
std::string sqliteConnectionString(const std::string& path, AccessMode mode);

// ========== Openers ==========

/**
 * @brief Embedded analytical engine ("duckdb")
 *
 * DuckDB refuses a read-only open while an uncheckpointed WAL sits next to
 * the file, since replaying it needs write access. A writer that exited
 * without checkpointing leaves the file in exactly that state. On the first
 * failed read-only attempt of a call, this opener opens the same file
 * read-write, runs CHECKPOINT and closes it again before retrying. A failed
 * checkpoint is logged and the loop goes on.
 */
class DuckDBOpener : public Opener {
public:
    static constexpr const char* DRIVER_NAME = "duckdb";

    DuckDBOpener(std::shared_ptr<DriverRegistry> registry, Sleeper sleeper);

    std::unique_ptr<Database> open(const OpenOptions& options,
                                   const Context& ctx,
                                   const Logger& logger) override;

private:
    void recoverWal(const std::string& path, const Logger& logger) const;

    std::shared_ptr<DriverRegistry> registry_;
    Sleeper sleeper_;
};

/**
 * @brief Embedded row store ("sqlite")
 *
 * The driver's own busy timeout absorbs short lock waits; the retry loop
 * covers contention that outlasts it.
 */
class SQLiteOpener : public Opener {
public:
    SQLiteOpener(std::shared_ptr<SQLiteDriverResolver> resolver, Sleeper sleeper);

    /**
     * @throws DriverNotFoundException before any attempt if no SQLite
     *         driver works
     */
    std::unique_ptr<Database> open(const OpenOptions& options,
                                   const Context& ctx,
                                   const Logger& logger) override;

private:
    std::shared_ptr<SQLiteDriverResolver> resolver_;
    Sleeper sleeper_;
};

/**
 * @brief Network relational engine ("mysql"); the path is a DSN
 */
class MySQLOpener : public Opener {
public:
    static constexpr const char* DRIVER_NAME = "mysql";

    MySQLOpener(std::shared_ptr<DriverRegistry> registry, Sleeper sleeper);

    std::unique_ptr<Database> open(const OpenOptions& options,
                                   const Context& ctx,
                                   const Logger& logger) override;

private:
    std::shared_ptr<DriverRegistry> registry_;
    Sleeper sleeper_;
};

} // namespace dbmanager
