#ifndef CONDUIT_ASIO_TCP_SOCKET_HPP
#define CONDUIT_ASIO_TCP_SOCKET_HPP

#include <memory>
#include <chrono>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/steady_timer.hpp>

#include "../../util/logger.hpp"
#include "socket.hpp"

namespace conduit::asio {

class tcp_socket : public socket {

public:
    // constructors and destructors
    tcp_socket(const std::string &context, boost::asio::io_context &io_context);
    tcp_socket(const std::string &context, boost::asio::ip::tcp::socket&& socket);
    ~tcp_socket() override;

    // socket control
    awaitable<boost::system::error_code> connect(
        const std::string &host,
        const std::string &port,
        std::chrono::seconds timeout);
    void close() override;
    void cancel() override;

    // read operations
    awaitable<transfer_result> read_some(uint8_t buffer[], size_t max_size) override;

    // write operations
    awaitable<transfer_result> write(const uint8_t buffer[], size_t size) override;

    // some getters to check the state
    bool is_open() const override;
    std::string get_remote_ip() const override;
    std::string get_remote_port() const override;
    std::string get_local_port() const;

    // other methods
    void enable_tcp_no_delay();
    boost::asio::ip::tcp::socket &get_socket();

protected:
    boost::asio::ip::tcp::socket socket_;
};

}

#endif
