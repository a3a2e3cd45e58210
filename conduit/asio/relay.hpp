#ifndef CONDUIT_ASIO_RELAY_HPP
#define CONDUIT_ASIO_RELAY_HPP

#include <memory>
#include <optional>
#include <functional>
#include <atomic>
#include <chrono>
#include <array>

#include <boost/asio/steady_timer.hpp>

#include "sockets/socket.hpp"
#include "../util/lifecycle.hpp"
#include "buffer_pool.hpp"
#include "activity_signal.hpp"
#include "copy_loop.hpp"
#include "idle_watchdog.hpp"
#include "relay_error.hpp"

namespace conduit::asio {

/// What started the shutdown of a relay session.
enum class shutdown_reason {
    none,
    /// one direction reached end-of-stream or failed
    completed,
    /// the idle watchdog fired
    idle_timeout,
    /// the lifecycle was cancelled, or cancel() was called
    cancelled
};

const char* to_string(shutdown_reason reason);

struct relay_result {
    std::uint64_t bytes_a_to_b = 0;
    std::uint64_t bytes_b_to_a = 0;
    /// empty on a clean end-of-stream, otherwise the first terminal condition of the session
    boost::system::error_code error;
    shutdown_reason reason = shutdown_reason::none;

    std::uint64_t total_bytes() const { return bytes_a_to_b + bytes_b_to_a; }
};

/// Bidirectional relay between two sockets, with idle timeout and cancellation.
/// Takes exclusive ownership of both sockets and closes them when the session ends.
/// A relay runs a single session; configure it before run()/start().
class relay : public std::enable_shared_from_this<relay> {
public:
    static constexpr std::chrono::hours DEFAULT_IDLE_TIMEOUT{2};
    static constexpr std::chrono::seconds DEFAULT_GRACE_PERIOD{1};

    using clock = std::chrono::steady_clock;

    relay(std::shared_ptr<socket> a, std::shared_ptr<socket> b);
    ~relay();

    /// maximum time without traffic in either direction, zero means DEFAULT_IDLE_TIMEOUT
    void set_idle_timeout(clock::duration timeout);

    /// how long to wait for the second direction once the first one ended
    void set_grace_period(clock::duration grace_period);

    /// share a buffer pool between relays, by default each relay owns one
    void set_buffer_pool(std::shared_ptr<buffer_pool> pool);

    /// completion callback used by start()
    void set_on_end(std::function<void(const relay_result&)> listener);

    /**
     * Relay both directions until one of them ends or fails, the session is idle
     * for the idle timeout, or the lifecycle is cancelled. The session runs in a
     * child of the given lifecycle (or in a new one if null).
     */
    awaitable<relay_result> run(std::shared_ptr<util::lifecycle> parent = nullptr);

    /// Fire-and-forget: co_spawn(run()) and report the result to the on_end listener.
    void start(std::shared_ptr<util::lifecycle> parent = nullptr);

    /// Stop the session from any thread.
    void cancel();

    bool shutting_down() const;
    shutdown_reason get_shutdown_reason() const;

    /// Transfer stats (safe to read from any thread).
    std::uint64_t bytes_a_to_b() const;
    std::uint64_t bytes_b_to_a() const;

    clock::duration idle_timeout() const;
    clock::duration grace_period() const;

    /// Socket access.
    std::shared_ptr<socket> get_a() const;
    std::shared_ptr<socket> get_b() const;

private:
    enum direction { a_to_b = 0, b_to_a = 1 };

    awaitable<relay_result> session(std::shared_ptr<util::lifecycle> parent);

    /// Stop writes, close both sockets and cancel the session lifecycle.
    /// Only the first call has any effect; returns whether this call did it.
    bool shutdown(shutdown_reason reason);

    void on_copy_done(direction dir, copy_result result);
    void on_watchdog_done(idle_watchdog::state state);

    std::shared_ptr<socket> a_;
    std::shared_ptr<socket> b_;
    strand_type strand_;

    clock::duration idle_timeout_{DEFAULT_IDLE_TIMEOUT};
    clock::duration grace_period_{DEFAULT_GRACE_PERIOD};
    std::shared_ptr<buffer_pool> pool_;
    std::function<void(const relay_result&)> on_end_;

    // session state, only touched from strand_
    std::shared_ptr<util::lifecycle> lifecycle_;
    std::shared_ptr<idle_watchdog> watchdog_;
    boost::asio::steady_timer progress_;
    std::array<std::optional<copy_result>, 2> results_;
    std::optional<direction> first_;
    bool watchdog_done_ = false;

    copy_loop a_to_b_;
    copy_loop b_to_a_;
    activity_signal a_to_b_activity_;
    activity_signal b_to_a_activity_;

    std::atomic<bool> started_{false};
    std::atomic<shutdown_reason> reason_{shutdown_reason::none};
};

}

#endif
