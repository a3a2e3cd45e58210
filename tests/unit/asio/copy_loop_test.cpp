#include <catch2/catch_test_macros.hpp>
#include <conduit/asio/copy_loop.hpp>
#include <conduit/asio/relay_error.hpp>
#include "fixtures/memory_socket.hpp"

#include <optional>
#include <stdexcept>

using namespace conduit;
using namespace conduit::asio;
using conduit::asio::test::memory_socket;
namespace net = boost::asio;

namespace {

copy_result run_copy(net::io_context& io, copy_loop& loop, buffer_pool& pool, activity_signal& activity) {
    std::optional<copy_result> result;
    co_spawn(io, loop.run(pool, activity), [&result](std::exception_ptr e, copy_result r) {
        if (e) std::rethrow_exception(e);
        result = r;
    });
    io.run();
    REQUIRE(result);
    return *result;
}

}

TEST_CASE("Copy loop forwards until end of stream", "[copy_loop][unit]") {
    net::io_context io;
    auto from = std::make_shared<memory_socket>("from", io);
    auto to = std::make_shared<memory_socket>("to", io);
    buffer_pool pool(1024);
    activity_signal activity;
    copy_loop loop(from, to, "from -> to");

    SECTION("all chunks are written and the loop ends cleanly") {
        from->push("hello");
        from->push(" world");
        from->end();

        auto result = run_copy(io, loop, pool, activity);

        REQUIRE_FALSE(result.error);
        REQUIRE(result.bytes == 11);
        REQUIRE(loop.bytes_written() == 11);
        REQUIRE(to->written() == "hello world");
        REQUIRE(activity.last() != activity_signal::clock::time_point{});
        REQUIRE(activity.retired());
        REQUIRE(pool.idle() == 1);
    }

    SECTION("chunks larger than the buffer are split") {
        buffer_pool small(4);
        from->push("abcdefghij");
        from->end();

        auto result = run_copy(io, loop, small, activity);

        REQUIRE_FALSE(result.error);
        REQUIRE(result.bytes == 10);
        REQUIRE(to->writes() == 3);
        REQUIRE(to->written() == "abcdefghij");
    }

    SECTION("an empty stream ends without writes") {
        from->end();

        auto result = run_copy(io, loop, pool, activity);

        REQUIRE_FALSE(result.error);
        REQUIRE(result.bytes == 0);
        REQUIRE(to->writes() == 0);
        REQUIRE(activity.last() == activity_signal::clock::time_point{});
        REQUIRE(activity.retired());
    }

    SECTION("read errors other than end of stream are terminal") {
        from->push("abc");
        from->end(net::error::connection_reset);

        auto result = run_copy(io, loop, pool, activity);

        REQUIRE(result.error == net::error::connection_reset);
        REQUIRE(result.bytes == 3);
        REQUIRE(to->written() == "abc");
    }

    SECTION("a stopped loop does not write") {
        from->push("data");
        from->end();
        loop.stop();

        auto result = run_copy(io, loop, pool, activity);

        REQUIRE(loop.stopped());
        REQUIRE_FALSE(result.error);
        REQUIRE(result.bytes == 0);
        REQUIRE(to->writes() == 0);
    }
}

TEST_CASE("Copy loop validates write results", "[copy_loop][unit]") {
    net::io_context io;
    auto from = std::make_shared<memory_socket>("from", io);
    auto to = std::make_shared<memory_socket>("to", io);
    buffer_pool pool(1024);
    activity_signal activity;
    copy_loop loop(from, to, "from -> to");

    from->push("hello");
    from->push("never forwarded");
    from->end();

    SECTION("fewer bytes without error is a short write") {
        to->set_write_behaviour([](const uint8_t*, size_t size) {
            return transfer_result{boost::system::error_code{}, static_cast<std::int64_t>(size) - 1};
        });

        auto result = run_copy(io, loop, pool, activity);

        REQUIRE(result.error == relay_errc::short_write);
        REQUIRE(result.bytes == 4);
        REQUIRE(to->writes() == 1);
        REQUIRE(activity.last() == activity_signal::clock::time_point{});
        REQUIRE(activity.retired());
    }

    SECTION("more bytes than requested is an invalid write result") {
        to->set_write_behaviour([](const uint8_t*, size_t size) {
            return transfer_result{boost::system::error_code{}, static_cast<std::int64_t>(size) + 10};
        });

        auto result = run_copy(io, loop, pool, activity);

        REQUIRE(result.error == relay_errc::invalid_write_result);
        REQUIRE(result.bytes == 0);
        REQUIRE(loop.bytes_written() == 0);
        REQUIRE(to->writes() == 1);
    }

    SECTION("a negative count is an invalid write result") {
        to->set_write_behaviour([](const uint8_t*, size_t) {
            return transfer_result{boost::system::error_code{}, -1};
        });

        auto result = run_copy(io, loop, pool, activity);

        REQUIRE(result.error == relay_errc::invalid_write_result);
        REQUIRE(result.bytes == 0);
    }

    SECTION("explicit write errors are reported verbatim") {
        to->set_write_behaviour([](const uint8_t*, size_t) {
            return transfer_result{net::error::broken_pipe, 2};
        });

        auto result = run_copy(io, loop, pool, activity);

        REQUIRE(result.error == net::error::broken_pipe);
        REQUIRE(result.bytes == 2);
    }

    SECTION("an explicit error wins over an impossible count") {
        to->set_write_behaviour([](const uint8_t*, size_t size) {
            return transfer_result{net::error::broken_pipe, static_cast<std::int64_t>(size) * 2};
        });

        auto result = run_copy(io, loop, pool, activity);

        REQUIRE(result.error == net::error::broken_pipe);
        REQUIRE(result.bytes == 0);
    }
}

TEST_CASE("Copy loop turns stream exceptions into errors", "[copy_loop][unit]") {
    net::io_context io;
    auto from = std::make_shared<memory_socket>("from", io);
    auto to = std::make_shared<memory_socket>("to", io);
    buffer_pool pool(1024);
    activity_signal activity;
    copy_loop loop(from, to, "from -> to");

    SECTION("a system error thrown by read_some is the loop error") {
        from->throw_on_read(std::make_exception_ptr(
            boost::system::system_error(net::error::connection_reset)));

        auto result = run_copy(io, loop, pool, activity);

        REQUIRE(result.error == net::error::connection_reset);
        REQUIRE(to->writes() == 0);
        REQUIRE(activity.retired());
        REQUIRE(pool.idle() == 1);
    }

    SECTION("a thrown end of stream ends the loop cleanly") {
        from->throw_on_read(std::make_exception_ptr(boost::system::system_error(net::error::eof)));

        auto result = run_copy(io, loop, pool, activity);

        REQUIRE_FALSE(result.error);
    }

    SECTION("other exceptions from write are a stream failure") {
        to->throw_on_write(std::make_exception_ptr(std::runtime_error("write exploded")));
        from->push("data");

        auto result = run_copy(io, loop, pool, activity);

        REQUIRE(result.error == relay_errc::stream_failure);
        REQUIRE(result.bytes == 0);
        REQUIRE(loop.bytes_written() == 0);
    }
}
