#include "idle_watchdog.hpp"
#include "../util/logger.hpp"

#include <algorithm>

namespace conduit::asio {

idle_watchdog::idle_watchdog(const boost::asio::any_io_executor& executor, clock::duration timeout)
    : timer_(executor),
      timeout_(timeout == clock::duration::zero() ? clock::duration(DEFAULT_TIMEOUT) : timeout) {
}

void idle_watchdog::watch(const activity_signal& signal) {
    signals_.push_back(&signal);
}

awaitable<idle_watchdog::state> idle_watchdog::run(std::shared_ptr<util::lifecycle> lifecycle, terminal_handler on_terminal) {
    auto self = shared_from_this();

    // cancellation may come from any thread: wake the timer from its own executor
    auto subscription = lifecycle->subscribe([weak = weak_from_this(), executor = timer_.get_executor()] {
        boost::asio::post(executor, [weak] {
            if (auto self = weak.lock()) {
                self->timer_.cancel();
            }
        });
    });

    const auto started = clock::now();
    timer_.expires_after(timeout_);

    for (;;) {
        boost::system::error_code ec;
        co_await timer_.async_wait(redirect_error(use_awaitable, ec));

        if (lifecycle->cancelled()) {
            state_ = state::cancelled;
            break;
        }

        // activity older than the start of the watch does not extend it
        auto deadline = last_activity(started) + timeout_;
        if (clock::now() >= deadline) {
            state_ = state::fired;
            break;
        }

        ++resets_;
        timer_.expires_at(deadline);
        LOG_TRACE("idle watchdog reset, {} ms left",
                  std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count());
    }

    lifecycle->unsubscribe(subscription);

    LOG_DEBUG("idle watchdog {} after {} resets", to_string(state_), resets_.load());

    if (on_terminal) on_terminal(state_);
    co_return state_.load();
}

idle_watchdog::clock::time_point idle_watchdog::last_activity(clock::time_point since) const {
    auto latest = since;
    for (auto* signal : signals_) {
        latest = std::max(latest, signal->last());
    }
    return latest;
}

idle_watchdog::state idle_watchdog::get_state() const {
    return state_;
}

idle_watchdog::clock::duration idle_watchdog::timeout() const {
    return timeout_;
}

unsigned idle_watchdog::resets() const {
    return resets_;
}

const char* to_string(idle_watchdog::state state) {
    switch (state) {
        case idle_watchdog::state::waiting:
            return "waiting";
        case idle_watchdog::state::fired:
            return "fired";
        case idle_watchdog::state::cancelled:
            return "cancelled";
    }
    return "unknown";
}

}
