#ifndef CONDUIT_ASIO_IDLE_WATCHDOG_HPP
#define CONDUIT_ASIO_IDLE_WATCHDOG_HPP

#include <memory>
#include <vector>
#include <chrono>
#include <atomic>
#include <functional>

#include <boost/asio/steady_timer.hpp>

#include "../util/types.hpp"
#include "../util/lifecycle.hpp"
#include "activity_signal.hpp"

namespace conduit::asio {

/**
 * Idle timer for a relay session. The countdown restarts on every activity
 * notified by the watched signals; the watchdog fires when no activity is seen
 * for the whole timeout, or ends as cancelled when the lifecycle is cancelled.
 * Exactly one terminal state is reached, and the terminal handler runs once.
 */
class idle_watchdog : public std::enable_shared_from_this<idle_watchdog> {
public:
    using clock = std::chrono::steady_clock;

    enum class state {
        waiting,
        fired,
        cancelled
    };

    using terminal_handler = std::function<void(state)>;

    static constexpr std::chrono::hours DEFAULT_TIMEOUT{2};

    /// zero timeout means DEFAULT_TIMEOUT
    idle_watchdog(const boost::asio::any_io_executor& executor, clock::duration timeout);

    /// watch an activity source; the signal must outlive run()
    void watch(const activity_signal& signal);

    /// Wait for idleness or cancellation. Must run on the executor given in the constructor,
    /// which must be a strand if the io_context is run by several threads.
    awaitable<state> run(std::shared_ptr<util::lifecycle> lifecycle, terminal_handler on_terminal = nullptr);

    state get_state() const;
    clock::duration timeout() const;

    /// number of times the countdown was restarted by activity
    unsigned resets() const;

private:
    clock::time_point last_activity(clock::time_point since) const;

    boost::asio::steady_timer timer_;
    clock::duration timeout_;
    std::vector<const activity_signal*> signals_;
    std::atomic<state> state_{state::waiting};
    std::atomic<unsigned> resets_{0};
};

const char* to_string(idle_watchdog::state state);

}

#endif
