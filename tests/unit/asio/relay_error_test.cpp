#include <catch2/catch_test_macros.hpp>
#include <conduit/asio/relay_error.hpp>
#include <boost/asio/error.hpp>

using namespace conduit::asio;

TEST_CASE("Relay error codes", "[relay_error][unit]") {

    SECTION("enum values convert to error codes of the relay category") {
        boost::system::error_code ec = relay_errc::short_write;
        REQUIRE(ec);
        REQUIRE(ec.category() == relay_category());
        REQUIRE(ec == relay_errc::short_write);
        REQUIRE(ec != relay_errc::invalid_write_result);
    }

    SECTION("category name and messages") {
        REQUIRE(std::string(relay_category().name()) == "conduit.relay");
        REQUIRE(make_error_code(relay_errc::short_write).message() == "short write");
        REQUIRE(make_error_code(relay_errc::invalid_write_result).message() == "invalid write result");
        REQUIRE(make_error_code(relay_errc::idle_timeout).message() == "relay idle timeout");
        REQUIRE(make_error_code(relay_errc::cancelled).message() == "relay cancelled");
        REQUIRE(make_error_code(relay_errc::stream_failure).message() == "stream failure");
    }

    SECTION("relay errors do not compare equal to asio errors with the same value") {
        boost::system::error_code ec = relay_errc::cancelled;
        boost::system::error_code aborted = boost::asio::error::operation_aborted;
        REQUIRE(ec != aborted);
    }
}
