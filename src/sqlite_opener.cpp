/**
 * @file sqlite_opener.cpp
 * @brief SQLite opener
 */

#include "dbmanager/opener.hpp"
#include "dbmanager/exceptions.hpp"

namespace dbmanager {

std::string sqliteConnectionString(const std::string& path, AccessMode mode) {
    std::string dsn = path + "?_journal_mode=WAL&_busy_timeout=5000";
    if (mode == AccessMode::ReadOnly) {
        dsn += "&mode=ro";
    }
    return dsn;
}

SQLiteOpener::SQLiteOpener(std::shared_ptr<SQLiteDriverResolver> resolver, Sleeper sleeper)
    : resolver_(std::move(resolver))
    , sleeper_(std::move(sleeper))
{
}

std::unique_ptr<Database> SQLiteOpener::open(const OpenOptions& options,
                                             const Context& ctx,
                                             const Logger& logger) {
    auto driverName = resolver_->resolve();
    if (!driverName) {
        std::string tried;
        for (const auto& name : resolver_->candidates()) {
            tried += tried.empty() ? name : ", " + name;
        }
        throw DriverNotFoundException("no working SQLite driver registered (tried " + tried + ")");
    }

    const std::string dsn = sqliteConnectionString(options.path, options.mode);
    auto registry = resolver_->registry();

    RetryRun run;
    run.engine = "sqlite";
    run.path = options.path;
    run.policy = retryPolicy(options);
    run.ctx = &ctx;
    run.logger = &logger;
    run.sleeper = &sleeper_;
    run.connect = [&] { return openAndVerify(*registry, *driverName, dsn); };

    return connectWithRetries(run);
}

} // namespace dbmanager
