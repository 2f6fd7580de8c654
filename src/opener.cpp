/**
 * @file opener.cpp
 * @brief Retry loop shared by every opener
 */

#include "dbmanager/opener.hpp"
#include "dbmanager/exceptions.hpp"

namespace dbmanager {

Sleeper contextSleeper() {
    return [](std::chrono::milliseconds delay, const Context& ctx) {
        return ctx.sleepFor(delay);
    };
}

std::unique_ptr<Database> openAndVerify(const DriverRegistry& registry,
                                        const std::string& name,
                                        const std::string& dsn) {
    auto driver = registry.find(name);
    if (!driver) {
        throw ConnectionException("no driver registered as '" + name + "'");
    }

    // A throw from ping destroys the handle, which closes whatever it opened
    auto db = std::make_unique<Database>(std::move(driver), dsn);
    applyPoolShape(*db);
    db->ping();
    return db;
}

std::unique_ptr<Database> connectWithRetries(const RetryRun& run) {
    const Logger& log = run.logger ? *run.logger : noopLogger();
    const Context background = Context::background();
    const Context& ctx = run.ctx ? *run.ctx : background;

    std::string lastError = "no attempt made";
    int attempts = 0;

    for (int i = 0; i < run.policy.maxRetries; ++i) {
        if (ctx.done()) {
            throw CancelledException(run.path, attempts);
        }

        ++attempts;
        try {
            return run.connect();
        } catch (const DatabaseException& e) {
            lastError = e.what();
        }

        log(std::string("[") + run.engine + "] attempt " + std::to_string(i + 1) + "/" +
            std::to_string(run.policy.maxRetries) + " to open '" + run.path +
            "' failed: " + lastError);

        if (run.afterFailure) {
            run.afterFailure(i);
        }

        // No sleep after the final attempt
        if (i + 1 < run.policy.maxRetries) {
            auto delay = backoffDelay(run.policy, i);
            bool slept = run.sleeper ? (*run.sleeper)(delay, ctx) : ctx.sleepFor(delay);
            if (!slept) {
                throw CancelledException(run.path, attempts);
            }
        }
    }

    std::string note = run.exhaustedNote ? run.exhaustedNote() : std::string();
    throw RetriesExhaustedException(run.path, attempts, lastError, note);
}

} // namespace dbmanager
