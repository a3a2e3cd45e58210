#ifndef CONDUIT_ASIO_SOCKET_HPP
#define CONDUIT_ASIO_SOCKET_HPP

#include <tuple>
#include <cstdint>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/buffer.hpp>

#include "../../util/types.hpp"

namespace conduit::asio {

/// Outcome of a single read or write: error (if any) and the byte count reported by the stream.
/// The count is signed so implementations can report impossible results, which callers validate.
using transfer_result = std::tuple<boost::system::error_code, std::int64_t>;

/// Duplex byte stream with independent read and write, and a close that ends both directions.
class socket : private boost::asio::noncopyable {

public:
    // constructors and destructors
    socket(const std::string &context, boost::asio::io_context &io_context);
    virtual ~socket();

    // socket control
    virtual void close() = 0;
    virtual void cancel() = 0;

    // read operations
    virtual awaitable<transfer_result> read_some(uint8_t buffer[], size_t max_size) = 0;

    // write operations
    virtual awaitable<transfer_result> write(const uint8_t buffer[], size_t size) = 0;

    // some getters to check the state
    virtual bool is_open() const = 0;
    virtual std::string get_remote_ip() const = 0;
    virtual std::string get_remote_port() const = 0;

    // other methods
    boost::asio::io_context &get_io_context() const;
    const std::string& get_context() const;

protected:
    std::string context_;
    boost::asio::io_context &io_context_;
};

}

#endif
