#include <conduit/asio/relay.hpp>
#include <conduit/asio/sockets/tcp_socket.hpp>
#include <conduit/util/logger.hpp>

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <iostream>
#include <cstdlib>
#include <string>

using namespace conduit;
using namespace conduit::asio;
namespace net = boost::asio;
using net::ip::tcp;

namespace {

struct relay_config {
    unsigned short listen_port = 0;
    std::string target_host;
    std::string target_port;
    std::chrono::seconds idle_timeout{0};
};

awaitable<void> relay_connection(tcp::socket accepted,
                                 relay_config config,
                                 std::shared_ptr<buffer_pool> pool,
                                 std::shared_ptr<util::lifecycle> lifecycle)
{
    auto& io = static_cast<net::io_context&>(accepted.get_executor().context());

    auto client = std::make_shared<tcp_socket>("client", std::move(accepted));
    auto target = std::make_shared<tcp_socket>("target", io);

    auto ec = co_await target->connect(config.target_host, config.target_port, std::chrono::seconds(10));
    if (ec) {
        LOG_ERROR("cannot connect to {}:{}: {}", config.target_host, config.target_port, ec.message());
        client->close();
        co_return;
    }
    client->enable_tcp_no_delay();
    target->enable_tcp_no_delay();

    auto session = std::make_shared<relay>(client, target);
    session->set_idle_timeout(config.idle_timeout);
    session->set_buffer_pool(pool);

    LOG_INFO("relaying {}:{} <-> {}:{}", client->get_remote_ip(), client->get_remote_port(),
             config.target_host, config.target_port);

    auto result = co_await session->run(lifecycle);

    LOG_INFO("relay finished ({}): {} bytes sent, {} bytes received, {}",
             to_string(result.reason), result.bytes_a_to_b, result.bytes_b_to_a,
             result.error ? result.error.message() : "ok");
}

awaitable<void> accept_loop(tcp::acceptor& acceptor,
                            relay_config config,
                            std::shared_ptr<buffer_pool> pool,
                            std::shared_ptr<util::lifecycle> lifecycle)
{
    for (;;) {
        boost::system::error_code ec;
        auto sock = co_await acceptor.async_accept(redirect_error(use_awaitable, ec));
        if (ec) {
            if (ec != net::error::operation_aborted) {
                LOG_ERROR("accept error: {}", ec.message());
            }
            break;
        }
        co_spawn(acceptor.get_executor(), relay_connection(std::move(sock), config, pool, lifecycle), detached);
    }
}

}

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "usage: " << argv[0] << " <listen_port> <target_host> <target_port> [idle_timeout_seconds]" << std::endl;
        return EXIT_FAILURE;
    }

    conduit::logging::enable();
    if (const char* level = std::getenv("CONDUIT_LOG_LEVEL")) {
        conduit::logging::set_log_level(std::string(level));
    }

    relay_config config;
    try {
        config.listen_port = static_cast<unsigned short>(std::stoul(argv[1]));
        config.target_host = argv[2];
        config.target_port = argv[3];
        if (argc > 4) config.idle_timeout = std::chrono::seconds(std::stoul(argv[4]));
    } catch (const std::exception& e) {
        std::cerr << "invalid argument: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    net::io_context io;
    auto pool = std::make_shared<buffer_pool>();
    auto lifecycle = util::lifecycle::create();

    tcp::acceptor acceptor(io);
    boost::system::error_code ec;
    tcp::endpoint endpoint(tcp::v4(), config.listen_port);
    acceptor.open(endpoint.protocol(), ec);
    if (!ec) acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor.bind(endpoint, ec);
    if (!ec) acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        CONDUIT_LOG_ERROR("cannot listen on port {}: {}", config.listen_port, ec.message());
        return EXIT_FAILURE;
    }

    // stop accepting and cancel every running relay on SIGINT/SIGTERM
    net::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& error, int signal_number) {
        if (error) return;
        LOG_INFO("received signal: {}", signal_number);
        boost::system::error_code ignored;
        acceptor.close(ignored);
        lifecycle->cancel();
    });

    CONDUIT_LOG("listening on port {}, relaying to {}:{}", config.listen_port, config.target_host, config.target_port);
    co_spawn(io, accept_loop(acceptor, config, pool, lifecycle), detached);

    io.run();
    return EXIT_SUCCESS;
}
