/**
 * @file context.hpp
 * @brief Cancellation and deadlines for blocking open calls
 *
 * An open may sleep for several seconds between retries. A Context lets the
 * caller bound that: the backoff sleep is raced against cancel() and the
 * deadline, and the open stops with CancelledException when either fires.
 *
 * Contexts are cheap to copy; copies share the same cancellation state.
 *
 *   auto ctx = Context::withTimeout(std::chrono::seconds(2));
 *   auto db = manager.open(opts, ctx);
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace dbmanager {

class Context {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief A context that never fires
     */
    static Context background();

    static Context withCancel();
    static Context withDeadline(Clock::time_point deadline);
    static Context withTimeout(Clock::duration timeout);

    /**
     * @brief Fire the context, waking any sleeper
     *
     * No effect on a background context.
     */
    void cancel() const;

    /**
     * @brief True once cancelled or past the deadline
     */
    bool done() const;

    /**
     * @brief Block for @p duration or until the context fires
     * @return false if the context fired before the full duration elapsed
     */
    bool sleepFor(std::chrono::milliseconds duration) const;

    std::optional<Clock::time_point> deadline() const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
        std::optional<Clock::time_point> deadline;
    };

    explicit Context(std::shared_ptr<State> state)
        : state_(std::move(state)) {}

    // Null for background()
    std::shared_ptr<State> state_;
};

} // namespace dbmanager
