#ifndef CONDUIT_TYPES
#define CONDUIT_TYPES

#include <functional>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/strand.hpp>

namespace conduit {

    // Awaitable type alias
    template<typename T = void>
    using awaitable = boost::asio::awaitable<T>;

    // Import commonly used awaitable utilities
    using boost::asio::use_awaitable;
    using boost::asio::co_spawn;
    using boost::asio::detached;

    // For error handling without exceptions: co_await op(redirect_error(use_awaitable, ec))
    using boost::asio::redirect_error;

    // Executor used to serialize all the handlers of a single relay session
    using strand_type = boost::asio::strand<boost::asio::io_context::executor_type>;

}

#endif
