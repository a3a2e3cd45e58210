#ifndef CONDUIT_ASIO_RELAY_ERROR_HPP
#define CONDUIT_ASIO_RELAY_ERROR_HPP

#include <type_traits>
#include <boost/system/error_code.hpp>

namespace conduit::asio {

/// Terminal conditions produced by the relay itself (I/O errors are reported verbatim).
enum class relay_errc {
    /// a write accepted fewer bytes than requested without reporting an error
    short_write = 1,
    /// a write reported a negative byte count, or more bytes than requested
    invalid_write_result,
    /// no bytes were transferred in either direction for the configured idle timeout
    idle_timeout,
    /// the session lifecycle was cancelled before both directions ended
    cancelled,
    /// a stream operation failed with an exception that carried no error code
    stream_failure
};

const boost::system::error_category& relay_category() noexcept;

boost::system::error_code make_error_code(relay_errc code) noexcept;

}

namespace boost::system {

template<>
struct is_error_code_enum<conduit::asio::relay_errc> : std::true_type {};

}

#endif
