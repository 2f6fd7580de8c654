/**
 * @file context.cpp
 * @brief Implementation of Context
 */

#include "dbmanager/context.hpp"

#include <thread>

namespace dbmanager {

Context Context::background() {
    return Context(nullptr);
}

Context Context::withCancel() {
    return Context(std::make_shared<State>());
}

Context Context::withDeadline(Clock::time_point deadline) {
    auto state = std::make_shared<State>();
    state->deadline = deadline;
    return Context(std::move(state));
}

Context Context::withTimeout(Clock::duration timeout) {
    return withDeadline(Clock::now() + timeout);
}

void Context::cancel() const {
    if (!state_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool Context::done() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        return true;
    }
    return state_->deadline && Clock::now() >= *state_->deadline;
}

bool Context::sleepFor(std::chrono::milliseconds duration) const {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return true;
    }

    auto wakeAt = Clock::now() + duration;
    std::unique_lock<std::mutex> lock(state_->mutex);

    // Wake at whichever comes first: the end of the sleep or the deadline
    auto until = wakeAt;
    if (state_->deadline && *state_->deadline < until) {
        until = *state_->deadline;
    }

    state_->cv.wait_until(lock, until, [this] { return state_->cancelled; });

    if (state_->cancelled) {
        return false;
    }
    return Clock::now() >= wakeAt;
}

std::optional<Context::Clock::time_point> Context::deadline() const {
    if (!state_) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->deadline;
}

} // namespace dbmanager
