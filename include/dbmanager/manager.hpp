/**
 * @file manager.hpp
 * @brief DBManager: one entry point for opening any supported engine
 *
 * Usage:
 *   dbmanager::registerBuiltinDrivers();
 *   DBManager manager(Engine::DuckDB, spdlogLogger(spdlog::default_logger()));
 *
 *   auto ro = manager.openReadOnly("data/analytics.duckdb");
 *   auto rw = manager.openWritable("data/analytics.duckdb");
 *
 *   OpenOptions opts;
 *   opts.engine = Engine::MySQL;
 *   opts.path = "app:secret@tcp(db:3306)/shop";
 *   auto mysql = manager.open(opts);
 *
 * The manager is immutable after construction and may be shared between
 * threads. open() blocks the calling thread while it retries.
 */

#pragma once

#include <memory>
#include <string>
#include "context.hpp"
#include "database.hpp"
#include "driver.hpp"
#include "logger.hpp"
#include "opener.hpp"
#include "options.hpp"
#include "sqlite_resolver.hpp"

namespace dbmanager {

/**
 * @brief Collaborators the standard openers are built from
 *
 * Every member is optional. Unset members fall back to the process-wide
 * registry, a resolver over that registry (the shared one when the registry
 * is the global registry) and a sleeper that really sleeps.
 */
struct ManagerHooks {
    std::shared_ptr<DriverRegistry> registry;
    std::shared_ptr<SQLiteDriverResolver> resolver;
    Sleeper sleeper;
};

/**
 * @brief The DuckDB, SQLite and MySQL openers wired to @p hooks
 */
OpenerTable defaultOpeners(const ManagerHooks& hooks = ManagerHooks{});

class DBManager {
public:
    /**
     * @param defaultEngine Engine used when OpenOptions::engine is Default
     * @param logger Diagnostic sink; an empty one is replaced by noopLogger()
     */
    explicit DBManager(Engine defaultEngine, Logger logger = Logger{});

    DBManager(Engine defaultEngine, Logger logger, const ManagerHooks& hooks);

    /**
     * @brief Manager over a caller-built opener table
     */
    DBManager(Engine defaultEngine, Logger logger, OpenerTable openers);

    Engine defaultEngine() const { return defaultEngine_; }

    /**
     * @brief Open a fresh handle
     *
     * @throws UnsupportedEngineException immediately if no opener serves the
     *         engine; nothing is retried or logged
     * @throws DriverNotFoundException if the engine has no usable driver
     * @throws RetriesExhaustedException after the last failed attempt
     * @throws CancelledException if @p ctx fires while retrying
     */
    std::unique_ptr<Database> open(const OpenOptions& options,
                                   const Context& ctx = Context::background()) const;

    std::unique_ptr<Database> openReadOnly(const std::string& path) const;
    std::unique_ptr<Database> openWritable(const std::string& path) const;

    /**
     * @brief Open a file that was just created
     *
     * Nobody else can hold a lock on it yet, so this makes exactly one
     * attempt and never sleeps.
     */
    std::unique_ptr<Database> openNew(const std::string& path) const;

    const OpenerTable& openers() const { return openers_; }

private:
    Engine defaultEngine_;
    Logger logger_;
    OpenerTable openers_;
};

} // namespace dbmanager
