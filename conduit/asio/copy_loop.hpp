#ifndef CONDUIT_ASIO_COPY_LOOP_HPP
#define CONDUIT_ASIO_COPY_LOOP_HPP

#include <memory>
#include <atomic>
#include <string>
#include <cstdint>

#include "sockets/socket.hpp"
#include "buffer_pool.hpp"
#include "activity_signal.hpp"

namespace conduit::asio {

/// Terminal outcome of one relay direction. An empty error means the source reached end-of-stream.
struct copy_result {
    std::uint64_t bytes = 0;
    boost::system::error_code error;
};

/// Moves bytes in one direction, from -> to, until end-of-stream or the first error.
class copy_loop {
public:
    copy_loop(std::shared_ptr<socket> from, std::shared_ptr<socket> to, std::string name);

    /**
     * Forward data until the source ends or a read/write fails. Every full write
     * notifies the activity signal, which is retired when the loop exits.
     */
    awaitable<copy_result> run(buffer_pool& pool, activity_signal& activity);

    /// Forbid any further write. A loop blocked on I/O notices once its sockets are closed.
    void stop();

    bool stopped() const;

    /// Bytes written so far (safe to read from any thread).
    std::uint64_t bytes_written() const;

    const std::string& name() const;

private:
    std::shared_ptr<socket> from_;
    std::shared_ptr<socket> to_;
    std::string name_;
    std::atomic<bool> stopped_{false};
    std::atomic<std::uint64_t> written_{0};
};

}

#endif
