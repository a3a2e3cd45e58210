#include "buffer_pool.hpp"
#include "../util/logger.hpp"

namespace conduit::asio {

buffer_pool::lease::lease(buffer_pool& pool)
    : pool_(&pool), buffer_(pool.acquire()) {
}

buffer_pool::lease::lease(lease&& other) noexcept
    : pool_(other.pool_), buffer_(std::move(other.buffer_)) {
    other.pool_ = nullptr;
}

buffer_pool::lease::~lease() {
    if (pool_) pool_->release(std::move(buffer_));
}

buffer_pool::buffer_pool(size_t buffer_size, size_t max_idle)
    : buffer_size_(buffer_size), max_idle_(max_idle) {
    idle_.reserve(max_idle_);
}

buffer_pool::buffer buffer_pool::acquire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            buffer reused = std::move(idle_.back());
            idle_.pop_back();
            return reused;
        }
    }
    LOG_TRACE("buffer pool: allocating new buffer of {} bytes", buffer_size_);
    return buffer(buffer_size_);
}

void buffer_pool::release(buffer&& released) {
    if (released.size() != buffer_size_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (idle_.size() < max_idle_) {
        idle_.emplace_back(std::move(released));
    }
}

buffer_pool::lease buffer_pool::borrow() {
    return lease(*this);
}

size_t buffer_pool::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

}
