#include "tcp_socket_server.hpp"
#include "../util/logger.hpp"

#include <chrono>

namespace hellod::asio {

tcp_socket_server::tcp_socket_server(boost::asio::io_context& io_context)
    : io_context_(io_context)
    , acceptor_(io_context)
    , retry_timer_(io_context) {
}

tcp_socket_server::~tcp_socket_server() {
    stop();
}

bool tcp_socket_server::start(const std::string& host, const std::string& port) {
    if (running_ || !handler_) {
        return false;
    }
    bind_address_ = host + ":" + port;
    if (!bind(host, port)) {
        LOG_ERROR("bind to {} failed: {}", bind_address_, last_error_.message());
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }

    running_ = true;
    LOG_INFO("listening on {} (port {})", bind_address_, local_port());
    co_spawn(io_context_, [self = shared_from_this()]() -> awaitable<void> {
        co_await self->accept_loop();
    }, detached);
    return true;
}

bool tcp_socket_server::bind(const std::string& host, const std::string& port) {
    last_error_.clear();

    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, port, last_error_);
    if (last_error_) return false;
    if (endpoints.empty()) {
        last_error_ = boost::asio::error::host_not_found;
        return false;
    }
    auto endpoint = endpoints.begin()->endpoint();

    acceptor_.open(endpoint.protocol(), last_error_);
    if (last_error_) return false;
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true), last_error_);
    if (last_error_) return false;
    acceptor_.bind(endpoint, last_error_);
    if (last_error_) return false;
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, last_error_);
    return !last_error_;
}

void tcp_socket_server::stop() {
    if (!running_) return;
    running_ = false;
    LOG_DEBUG("closing acceptor on {}", bind_address_);

    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        LOG_WARNING("error closing acceptor on {}: {}", bind_address_, ec.message());
    }
    retry_timer_.cancel();
}

uint16_t tcp_socket_server::local_port() const {
    if (!acceptor_.is_open()) return 0;
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

awaitable<void> tcp_socket_server::accept_loop() {
    while (running_) {
        auto socket = std::make_shared<tcp_socket>(io_context_);
        boost::system::error_code ec;
        co_await acceptor_.async_accept(socket->get_socket(), redirect_error(use_awaitable, ec));

        if (!running_ || ec == boost::asio::error::operation_aborted) break;

        if (ec) {
            // persistent failures such as descriptor exhaustion, retry later
            LOG_ERROR("cannot accept connections on {}: {}", bind_address_, ec.message());
            retry_timer_.expires_after(std::chrono::seconds(1));
            co_await retry_timer_.async_wait(redirect_error(use_awaitable, ec));
            continue;
        }

        socket->get_socket().set_option(boost::asio::ip::tcp::no_delay(true), ec);
        LOG_DEBUG("accepted connection from {}", socket->get_remote_ip());
        handler_(std::move(socket));
    }
    LOG_DEBUG("stopped accepting connections on {}", bind_address_);
}

} // namespace hellod::asio
