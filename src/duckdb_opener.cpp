/**
 * @file duckdb_opener.cpp
 * @brief DuckDB opener with one-shot WAL checkpoint recovery
 */

#include "dbmanager/opener.hpp"
#include "dbmanager/exceptions.hpp"

#include <filesystem>
#include <system_error>

namespace dbmanager {

std::string duckdbConnectionString(const std::string& path, AccessMode mode) {
    if (mode == AccessMode::ReadOnly) {
        return path + "?access_mode=read_only";
    }
    return path;
}

DuckDBOpener::DuckDBOpener(std::shared_ptr<DriverRegistry> registry, Sleeper sleeper)
    : registry_(std::move(registry))
    , sleeper_(std::move(sleeper))
{
}

std::unique_ptr<Database> DuckDBOpener::open(const OpenOptions& options,
                                             const Context& ctx,
                                             const Logger& logger) {
    const std::string dsn = duckdbConnectionString(options.path, options.mode);
    bool recoveryAttempted = false;

    RetryRun run;
    run.engine = DRIVER_NAME;
    run.path = options.path;
    run.policy = retryPolicy(options);
    run.ctx = &ctx;
    run.logger = &logger;
    run.sleeper = &sleeper_;
    run.connect = [&] { return openAndVerify(*registry_, DRIVER_NAME, dsn); };
    run.afterFailure = [&](int) {
        if (options.mode != AccessMode::ReadOnly || recoveryAttempted) {
            return;
        }
        recoveryAttempted = true;
        recoverWal(options.path, logger);
    };
    run.exhaustedNote = [&] {
        return recoveryAttempted ? std::string("(checkpoint recovery attempted)") : std::string();
    };

    return connectWithRetries(run);
}

void DuckDBOpener::recoverWal(const std::string& path, const Logger& logger) const {
    // Opening a missing file read-write would create an empty database
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        logger("[duckdb] skipping checkpoint recovery: '" + path + "' does not exist");
        return;
    }

    auto driver = registry_->find(DRIVER_NAME);
    if (!driver) {
        logger("[duckdb] checkpoint of '" + path + "' failed: no driver registered as '" +
               std::string(DRIVER_NAME) + "'");
        return;
    }

    try {
        // CHECKPOINT is the only statement, so the file is opened read-write
        // exactly once. The handle is destroyed, and so closed, on both paths.
        Database db(std::move(driver), duckdbConnectionString(path, AccessMode::ReadWrite));
        applyPoolShape(db);
        db.execute("CHECKPOINT");
        logger("[duckdb] checkpoint of '" + path + "' succeeded");
    } catch (const DatabaseException& e) {
        logger("[duckdb] checkpoint of '" + path + "' failed: " + std::string(e.what()));
    }
}

} // namespace dbmanager
