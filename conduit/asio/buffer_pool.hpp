#ifndef CONDUIT_ASIO_BUFFER_POOL_HPP
#define CONDUIT_ASIO_BUFFER_POOL_HPP

#include <mutex>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace conduit::asio {

/**
 * Pool of reusable fixed-size byte buffers, safe for concurrent use.
 * Buffers returned by acquire() may contain stale data from a previous user;
 * callers must only consider the bytes they filled themselves.
 */
class buffer_pool {
public:
    static constexpr size_t DEFAULT_BUFFER_SIZE = 32 * 1024;
    static constexpr size_t DEFAULT_MAX_IDLE = 64;

    using buffer = std::vector<uint8_t>;

    /// Buffer borrowed from the pool, released back when destroyed.
    class lease {
    public:
        explicit lease(buffer_pool& pool);
        ~lease();

        lease(lease&& other) noexcept;
        lease(const lease&) = delete;
        lease& operator=(const lease&) = delete;
        lease& operator=(lease&&) = delete;

        uint8_t* data() { return buffer_.data(); }
        size_t size() const { return buffer_.size(); }

    private:
        buffer_pool* pool_;
        buffer buffer_;
    };

    explicit buffer_pool(size_t buffer_size = DEFAULT_BUFFER_SIZE, size_t max_idle = DEFAULT_MAX_IDLE);

    /// get a buffer of buffer_size() bytes, reusing an idle one if possible
    buffer acquire();

    /// give a buffer back; buffers of a different size, or beyond max_idle, are dropped
    void release(buffer&& released);

    /// acquire a buffer that is released automatically
    lease borrow();

    size_t buffer_size() const { return buffer_size_; }
    size_t max_idle() const { return max_idle_; }

    /// number of buffers currently available for reuse
    size_t idle() const;

private:
    const size_t buffer_size_;
    const size_t max_idle_;
    std::vector<buffer> idle_;
    mutable std::mutex mutex_;
};

}

#endif
