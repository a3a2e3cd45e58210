#include "tcp_socket.hpp"

namespace conduit::asio {

tcp_socket::tcp_socket(const std::string& context, boost::asio::io_context& io_context)
    : socket(context, io_context), socket_(io_context) {
}

tcp_socket::tcp_socket(const std::string& context, boost::asio::ip::tcp::socket&& sock)
    : socket(context, static_cast<boost::asio::io_context&>(sock.get_executor().context())), socket_(std::move(sock)) {
}

tcp_socket::~tcp_socket() {
    LOG_TRACE("releasing tcp connection");
    close();
}

void tcp_socket::close() {
    boost::system::error_code ec;
    if (socket_.is_open()) {
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }
    socket_.close(ec);
    LOG_TRACE("closing tcp socket result: {}", ec.message());
}

void tcp_socket::cancel() {
    boost::system::error_code ec;
    socket_.cancel(ec);
}

awaitable<boost::system::error_code> tcp_socket::connect(
    const std::string& host,
    const std::string& port,
    std::chrono::seconds timeout)
{
    close();

    // Resolve host
    boost::system::error_code ec;
    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = co_await resolver.async_resolve(
        host, port, redirect_error(use_awaitable, ec));

    if (ec) {
        co_return ec;
    }

    // Setup timeout timer, it cancels the connect attempt when expired
    auto timer = std::make_shared<boost::asio::steady_timer>(io_context_);
    auto timed_out = std::make_shared<bool>(false);
    timer->expires_after(timeout);
    timer->async_wait([this, timer, timed_out](const boost::system::error_code& e) {
        if (!e) {
            *timed_out = true;
            boost::system::error_code ignored;
            socket_.cancel(ignored);
        }
    });

    co_await boost::asio::async_connect(socket_, endpoints, redirect_error(use_awaitable, ec));
    timer->cancel();

    if (ec) {
        co_return *timed_out ? boost::asio::error::timed_out : ec;
    }

    co_return boost::system::error_code{};
}

boost::asio::ip::tcp::socket& tcp_socket::get_socket() {
    return socket_;
}

void tcp_socket::enable_tcp_no_delay() {
    boost::system::error_code ec;
    socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
    if (ec) {
        LOG_WARNING("cannot enable tcp no delay: {}", ec.message());
    }
}

std::string tcp_socket::get_remote_ip() const {
    boost::system::error_code ec;
    auto remote_ep = socket_.remote_endpoint(ec);
    if (!ec) {
        return remote_ep.address().to_string();
    }
    return "0.0.0.0";
}

std::string tcp_socket::get_local_port() const {
    boost::system::error_code ec;
    auto local_ep = socket_.local_endpoint(ec);
    if (!ec) {
        return std::to_string(local_ep.port());
    }
    return "0";
}

std::string tcp_socket::get_remote_port() const {
    boost::system::error_code ec;
    auto remote_ep = socket_.remote_endpoint(ec);
    if (!ec) {
        return std::to_string(remote_ep.port());
    }
    return "0";
}

awaitable<transfer_result> tcp_socket::read_some(uint8_t* buffer, size_t max_size) {
    boost::system::error_code ec;
    auto bytes = co_await socket_.async_read_some(
        boost::asio::buffer(buffer, max_size),
        redirect_error(use_awaitable, ec));
    co_return transfer_result{ec, static_cast<std::int64_t>(bytes)};
}

awaitable<transfer_result> tcp_socket::write(const uint8_t* buffer, size_t size) {
    boost::system::error_code ec;
    auto bytes = co_await boost::asio::async_write(
        socket_,
        boost::asio::buffer(buffer, size),
        redirect_error(use_awaitable, ec));
    co_return transfer_result{ec, static_cast<std::int64_t>(bytes)};
}

bool tcp_socket::is_open() const {
    return socket_.is_open();
}

}
