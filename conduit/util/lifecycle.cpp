#include "lifecycle.hpp"
#include "logger.hpp"

namespace conduit::util {

std::shared_ptr<lifecycle> lifecycle::create() {
    return std::shared_ptr<lifecycle>(new lifecycle());
}

lifecycle::~lifecycle() {
    if (parent_) {
        if (auto id = parent_subscription_.exchange(0)) {
            parent_->unsubscribe(id);
        }
    }
}

std::shared_ptr<lifecycle> lifecycle::create_child() {
    auto child = std::shared_ptr<lifecycle>(new lifecycle());
    child->parent_ = shared_from_this();
    std::weak_ptr<lifecycle> weak_child = child;
    child->parent_subscription_ = subscribe([weak_child] {
        if (auto child = weak_child.lock()) {
            child->cancel();
        }
    });
    return child;
}

void lifecycle::cancel() {
    std::map<subscription, listener> to_notify;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) return;
        cancelled_ = true;
        to_notify.swap(listeners_);
    }

    LOG_TRACE("lifecycle cancelled, notifying {} listeners", to_notify.size());

    // listeners may subscribe or cancel other lifecycles, so run them unlocked
    for (auto& [id, on_cancel] : to_notify) {
        on_cancel();
    }

    // a cancelled child no longer needs to hear from its parent
    if (parent_) {
        if (auto id = parent_subscription_.exchange(0)) {
            parent_->unsubscribe(id);
        }
    }
}

bool lifecycle::cancelled() const {
    return cancelled_;
}

lifecycle::subscription lifecycle::subscribe(listener on_cancel) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            auto id = next_id_++;
            listeners_.emplace(id, std::move(on_cancel));
            return id;
        }
    }
    on_cancel();
    return 0;
}

void lifecycle::unsubscribe(subscription id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(id);
}

size_t lifecycle::listeners() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

}
