#ifndef CONDUIT_UTIL_LIFECYCLE_HPP
#define CONDUIT_UTIL_LIFECYCLE_HPP

#include <map>
#include <mutex>
#include <atomic>
#include <memory>
#include <functional>

namespace conduit::util {

/**
 * Cancellable lifecycle handle shared by the tasks of a session.
 * Children created from a lifecycle are cancelled together with their parent,
 * but cancelling a child never affects the parent.
 * All methods are thread-safe.
 */
class lifecycle : public std::enable_shared_from_this<lifecycle> {
public:
    using listener = std::function<void()>;
    using subscription = std::size_t;

    /// create a root lifecycle
    static std::shared_ptr<lifecycle> create();

    ~lifecycle();

    /// create a lifecycle that is cancelled when this one is cancelled
    std::shared_ptr<lifecycle> create_child();

    /**
     * Cancel this lifecycle and all its children. Listeners are invoked once,
     * in the calling thread. Further calls are no-ops.
     */
    void cancel();

    bool cancelled() const;

    /**
     * Register a listener for cancellation. If the lifecycle is already
     * cancelled the listener is invoked immediately.
     * @return id for unsubscribe(), 0 if the listener was already invoked
     */
    subscription subscribe(listener on_cancel);

    /// remove a listener, no-op if it was already invoked or removed
    void unsubscribe(subscription id);

    /// number of registered listeners waiting for cancellation
    size_t listeners() const;

private:
    lifecycle() = default;

    mutable std::mutex mutex_;
    std::atomic<bool> cancelled_{false};
    std::map<subscription, listener> listeners_;
    subscription next_id_ = 1;

    // children keep their parent alive, so the parent subscription can be removed
    std::shared_ptr<lifecycle> parent_;
    std::atomic<subscription> parent_subscription_{0};
};

}

#endif
