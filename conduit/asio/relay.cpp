#include "relay.hpp"
#include "../util/logger.hpp"

#include <exception>
#include <stdexcept>
#include <string>

namespace conduit::asio {

namespace {

std::shared_ptr<socket> checked(std::shared_ptr<socket> sock) {
    if (!sock) throw std::invalid_argument("relay requires two sockets");
    return sock;
}

std::string describe(const std::exception_ptr& e) {
    try {
        std::rethrow_exception(e);
    } catch (const std::exception& ex) {
        return ex.what();
    } catch (...) {
        return "unknown exception";
    }
}

}

relay::relay(std::shared_ptr<socket> a, std::shared_ptr<socket> b)
    : a_(checked(std::move(a))),
      b_(checked(std::move(b))),
      strand_(boost::asio::make_strand(a_->get_io_context())),
      progress_(strand_),
      a_to_b_(a_, b_, a_->get_context() + " -> " + b_->get_context()),
      b_to_a_(b_, a_, b_->get_context() + " -> " + a_->get_context()) {
}

relay::~relay() {
    // a relay that never ran still owns its sockets
    if (reason_ == shutdown_reason::none) {
        a_->close();
        b_->close();
    }
}

void relay::set_idle_timeout(clock::duration timeout) {
    idle_timeout_ = timeout == clock::duration::zero() ? clock::duration(DEFAULT_IDLE_TIMEOUT) : timeout;
}

void relay::set_grace_period(clock::duration grace_period) {
    grace_period_ = grace_period;
}

void relay::set_buffer_pool(std::shared_ptr<buffer_pool> pool) {
    pool_ = std::move(pool);
}

void relay::set_on_end(std::function<void(const relay_result&)> listener) {
    on_end_ = std::move(listener);
}

awaitable<relay_result> relay::run(std::shared_ptr<util::lifecycle> parent) {
    if (started_.exchange(true)) {
        throw std::logic_error("relay session already started");
    }
    // all the session state lives in the strand, whatever executor is awaiting us
    co_return co_await co_spawn(strand_, session(std::move(parent)), use_awaitable);
}

void relay::start(std::shared_ptr<util::lifecycle> parent) {
    auto self = shared_from_this();
    co_spawn(strand_, [self, parent = std::move(parent)]() -> awaitable<void> {
        auto result = co_await self->run(parent);
        if (self->on_end_) self->on_end_(result);
    }, [](std::exception_ptr e) {
        if (e) LOG_ERROR("relay: session failed: {}", describe(e));
    });
}

void relay::cancel() {
    auto self = shared_from_this();
    boost::asio::dispatch(strand_, [self] {
        self->shutdown(shutdown_reason::cancelled);
    });
}

awaitable<relay_result> relay::session(std::shared_ptr<util::lifecycle> parent) {
    auto self = shared_from_this();

    lifecycle_ = parent ? parent->create_child() : util::lifecycle::create();
    if (!pool_) pool_ = std::make_shared<buffer_pool>();

    // writes stop as soon as the cancellation is known, from whatever thread it comes
    std::weak_ptr<relay> weak = self;
    lifecycle_->subscribe([weak] {
        if (auto session = weak.lock()) {
            session->a_to_b_.stop();
            session->b_to_a_.stop();
        }
    });

    if (lifecycle_->cancelled()) {
        shutdown(shutdown_reason::cancelled);
    } else if (reason_ != shutdown_reason::none) {
        // cancel() was called before the session started
        lifecycle_->cancel();
    }

    LOG_DEBUG("relay {} <-> {} started, idle timeout: {} ms", a_->get_context(), b_->get_context(),
              std::chrono::duration_cast<std::chrono::milliseconds>(idle_timeout_).count());

    watchdog_ = std::make_shared<idle_watchdog>(strand_, idle_timeout_);
    watchdog_->watch(a_to_b_activity_);
    watchdog_->watch(b_to_a_activity_);

    co_spawn(strand_,
        watchdog_->run(lifecycle_, [self](idle_watchdog::state state) {
            self->on_watchdog_done(state);
        }),
        [self](std::exception_ptr e, idle_watchdog::state) {
            if (e) {
                LOG_ERROR("relay: idle watchdog failed: {}", describe(e));
                self->shutdown(shutdown_reason::cancelled);
            }
            self->watchdog_done_ = true;
            self->progress_.cancel();
        });

    co_spawn(strand_, a_to_b_.run(*pool_, a_to_b_activity_),
        [self](std::exception_ptr e, copy_result result) {
            if (e) {
                LOG_ERROR("relay: {} failed: {}", self->a_to_b_.name(), describe(e));
                result.error = relay_errc::stream_failure;
            }
            self->on_copy_done(a_to_b, std::move(result));
        });

    co_spawn(strand_, b_to_a_.run(*pool_, b_to_a_activity_),
        [self](std::exception_ptr e, copy_result result) {
            if (e) {
                LOG_ERROR("relay: {} failed: {}", self->b_to_a_.name(), describe(e));
                result.error = relay_errc::stream_failure;
            }
            self->on_copy_done(b_to_a, std::move(result));
        });

    // wait for the first direction to end
    progress_.expires_at(clock::time_point::max());
    while (!first_) {
        boost::system::error_code ec;
        co_await progress_.async_wait(redirect_error(use_awaitable, ec));
    }

    relay_result result;
    const auto& first = *results_[*first_];
    if (shutdown(shutdown_reason::completed)) {
        result.error = first.error;
    } else if (reason_ == shutdown_reason::idle_timeout) {
        result.error = relay_errc::idle_timeout;
    } else {
        result.error = relay_errc::cancelled;
    }

    // shutdown cancelled the session lifecycle: wait for the watchdog to observe it,
    // and for the other direction to report, but never beyond the grace period
    progress_.expires_after(grace_period_);
    while (!(results_[a_to_b] && results_[b_to_a] && watchdog_done_)) {
        boost::system::error_code ec;
        co_await progress_.async_wait(redirect_error(use_awaitable, ec));
        if (!ec) break;
    }

    if (!results_[a_to_b] || !results_[b_to_a]) {
        LOG_DEBUG("relay: abandoning {} after grace period",
                  results_[a_to_b] ? b_to_a_.name() : a_to_b_.name());
    }
    if (!watchdog_done_) {
        LOG_WARNING("relay: idle watchdog did not observe the session cancellation");
    }

    result.bytes_a_to_b = a_to_b_.bytes_written();
    result.bytes_b_to_a = b_to_a_.bytes_written();
    result.reason = reason_;

    LOG_DEBUG("relay {} <-> {} ended ({}), {} bytes: {}", a_->get_context(), b_->get_context(),
              to_string(result.reason), result.total_bytes(),
              result.error ? result.error.message() : "ok");

    co_return result;
}

bool relay::shutdown(shutdown_reason reason) {
    auto expected = shutdown_reason::none;
    if (!reason_.compare_exchange_strong(expected, reason)) {
        LOG_TRACE("relay: shutdown ({}) ignored, already shutting down ({})", to_string(reason), to_string(expected));
        return false;
    }

    LOG_DEBUG("relay: shutting down ({})", to_string(reason));

    a_to_b_.stop();
    b_to_a_.stop();
    a_->close();
    b_->close();
    if (lifecycle_) lifecycle_->cancel();
    return true;
}

void relay::on_copy_done(direction dir, copy_result result) {
    if (first_ && result.error) {
        LOG_TRACE("relay: discarding error after shutdown: {}", result.error.message());
    }
    results_[dir] = std::move(result);
    if (!first_) first_ = dir;
    progress_.cancel();
}

void relay::on_watchdog_done(idle_watchdog::state state) {
    if (state == idle_watchdog::state::fired) {
        LOG_DEBUG("relay: no activity for {} ms",
                  std::chrono::duration_cast<std::chrono::milliseconds>(idle_timeout_).count());
        shutdown(shutdown_reason::idle_timeout);
    } else if (state == idle_watchdog::state::cancelled) {
        shutdown(shutdown_reason::cancelled);
    }
}

bool relay::shutting_down() const {
    return reason_ != shutdown_reason::none;
}

shutdown_reason relay::get_shutdown_reason() const {
    return reason_;
}

std::uint64_t relay::bytes_a_to_b() const {
    return a_to_b_.bytes_written();
}

std::uint64_t relay::bytes_b_to_a() const {
    return b_to_a_.bytes_written();
}

relay::clock::duration relay::idle_timeout() const {
    return idle_timeout_;
}

relay::clock::duration relay::grace_period() const {
    return grace_period_;
}

std::shared_ptr<socket> relay::get_a() const {
    return a_;
}

std::shared_ptr<socket> relay::get_b() const {
    return b_;
}

const char* to_string(shutdown_reason reason) {
    switch (reason) {
        case shutdown_reason::none:
            return "none";
        case shutdown_reason::completed:
            return "completed";
        case shutdown_reason::idle_timeout:
            return "idle timeout";
        case shutdown_reason::cancelled:
            return "cancelled";
    }
    return "unknown";
}

}
