/**
 * @file mysql_opener.cpp
 * @brief MySQL opener
 */

#include "dbmanager/opener.hpp"

namespace dbmanager {

MySQLOpener::MySQLOpener(std::shared_ptr<DriverRegistry> registry, Sleeper sleeper)
    : registry_(std::move(registry))
    , sleeper_(std::move(sleeper))
{
}

std::unique_ptr<Database> MySQLOpener::open(const OpenOptions& options,
                                            const Context& ctx,
                                            const Logger& logger) {
    // Retries here ride out a server that is still starting, not file locks
    RetryRun run;
    run.engine = DRIVER_NAME;
    run.path = options.path;
    run.policy = retryPolicy(options);
    run.ctx = &ctx;
    run.logger = &logger;
    run.sleeper = &sleeper_;
    run.connect = [&] { return openAndVerify(*registry_, DRIVER_NAME, options.path); };

    return connectWithRetries(run);
}

} // namespace dbmanager
