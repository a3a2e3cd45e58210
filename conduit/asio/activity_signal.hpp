#ifndef CONDUIT_ASIO_ACTIVITY_SIGNAL_HPP
#define CONDUIT_ASIO_ACTIVITY_SIGNAL_HPP

#include <atomic>
#include <chrono>

namespace conduit::asio {

/**
 * Latest progress made by one relay direction. notify() never blocks and
 * overwrites the previous value, as only the most recent activity matters.
 * Once retired, the signal ignores further notifications.
 */
class activity_signal {
public:
    using clock = std::chrono::steady_clock;

    void notify() noexcept {
        if (retired_.load(std::memory_order_acquire)) return;
        last_.store(clock::now().time_since_epoch().count(), std::memory_order_release);
    }

    /// time of the last notification, or clock epoch if there was none
    clock::time_point last() const noexcept {
        return clock::time_point(clock::duration(last_.load(std::memory_order_acquire)));
    }

    void retire() noexcept {
        retired_.store(true, std::memory_order_release);
    }

    bool retired() const noexcept {
        return retired_.load(std::memory_order_acquire);
    }

private:
    std::atomic<clock::rep> last_{0};
    std::atomic<bool> retired_{false};
};

}

#endif
