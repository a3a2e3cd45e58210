#include "copy_loop.hpp"
#include "relay_error.hpp"
#include "../util/logger.hpp"

#include <exception>

namespace conduit::asio {

copy_loop::copy_loop(std::shared_ptr<socket> from, std::shared_ptr<socket> to, std::string name)
    : from_(std::move(from)), to_(std::move(to)), name_(std::move(name)) {
}

awaitable<copy_result> copy_loop::run(buffer_pool& pool, activity_signal& activity) {
    copy_result result;
    auto buffer = pool.borrow();

    try {
        while (!stopped_) {
            auto [read_ec, read] = co_await from_->read_some(buffer.data(), buffer.size());

            // forward what was read even if the read also reported an error
            if (read > 0) {
                if (stopped_) {
                    LOG_TRACE("{}: stopped, discarding {} pending bytes", name_, read);
                    break;
                }

                auto [write_ec, written] = co_await to_->write(buffer.data(), static_cast<size_t>(read));
                if (written < 0 || written > read) {
                    written = 0;
                    if (!write_ec) write_ec = relay_errc::invalid_write_result;
                }

                result.bytes += written;
                written_.fetch_add(written, std::memory_order_relaxed);

                if (write_ec) {
                    result.error = write_ec;
                    break;
                }
                if (written != read) {
                    result.error = relay_errc::short_write;
                    break;
                }

                activity.notify();
            }

            if (read_ec) {
                if (read_ec != boost::asio::error::eof) {
                    result.error = read_ec;
                }
                break;
            }

            // a zero-byte read without error is treated as end-of-stream
            if (read <= 0) break;
        }
    } catch (const boost::system::system_error& e) {
        // streams may also fail by throwing
        if (e.code() != boost::asio::error::eof) {
            LOG_WARNING("{}: stream error: {}", name_, e.what());
            result.error = e.code();
        }
    } catch (const std::exception& e) {
        LOG_WARNING("{}: stream error: {}", name_, e.what());
        result.error = relay_errc::stream_failure;
    }

    activity.retire();

    LOG_DEBUG("{}: finished after {} bytes: {}", name_, result.bytes,
              result.error ? result.error.message() : "end of stream");

    co_return result;
}

void copy_loop::stop() {
    stopped_ = true;
}

bool copy_loop::stopped() const {
    return stopped_;
}

std::uint64_t copy_loop::bytes_written() const {
    return written_.load(std::memory_order_relaxed);
}

const std::string& copy_loop::name() const {
    return name_;
}

}
