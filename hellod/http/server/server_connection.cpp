#include "server_connection.hpp"
#include "response.hpp"
#include "../../util/logger.hpp"

namespace hellod::http {

server_connection::server_connection(std::shared_ptr<asio::tcp_socket> socket, std::string server_name)
    : socket_(std::move(socket))
    , server_name_(std::move(server_name))
    , timeout_timer_(socket_->get_socket().get_executor()) {
}

void server_connection::start(std::chrono::seconds timeout) {
    timeout_ = timeout;
    arm_timeout();
    co_spawn(socket_->get_socket().get_executor(),
             [self = shared_from_this()]() -> awaitable<void> {
                 co_await self->serve();
             },
             detached);
}

void server_connection::arm_timeout() {
    timeout_timer_.expires_after(timeout_);
    timeout_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec) return;
        LOG_DEBUG("closing idle connection from {} after {}s", self->socket_->get_remote_ip(), self->timeout_.count());
        self->close();
    });
}

void server_connection::close() {
    timeout_timer_.cancel();
    socket_->close();
}

awaitable<void> server_connection::serve() {
    // the peer address is gone once the socket is closed
    const auto remote_ip = socket_->get_remote_ip();
    auto result = co_await read_request();

    if (result.response) {
        result.response->log("response");
        std::vector<boost::asio::const_buffer> buffers;
        result.response->to_buffer(buffers);
        if (co_await socket_->write(buffers) == 0) {
            LOG_DEBUG("response to {} was not delivered", remote_ip);
        }
        if (access_log_) {
            access_log_(remote_ip, result.request.get(), *result.response);
        }
    }
    close();
}

awaitable<server_connection::exchange> server_connection::read_request() {
    size_t received = 0;
    while (socket_->is_open()) {
        auto bytes = co_await socket_->read_some(buffer_.data(), buffer_.size());
        if (bytes == 0) break;
        arm_timeout();
        received += bytes;

        const uint8_t* begin = buffer_.data();
        const uint8_t* end = begin + bytes;
        boost::tribool parsed = parser_.parse(begin, end);

        if (parsed) {
            auto request = parser_.consume_request();
            request->set_remote_ip(socket_->get_remote_ip());
            request->log("request");
            auto response = answer(*request);
            co_return exchange{std::move(request), std::move(response)};
        }
        if (!parsed) {
            LOG_DEBUG("malformed request head from {}", socket_->get_remote_ip());
            co_return exchange{nullptr, stock_reply(http_response::status::bad_request)};
        }
        if (received >= MAX_HEADER_SIZE) {
            LOG_WARNING("request head from {} exceeds {} bytes", socket_->get_remote_ip(), MAX_HEADER_SIZE);
            co_return exchange{nullptr, stock_reply(http_response::status::bad_request)};
        }
    }
    // peer closed or timed out before completing a request
    co_return exchange{};
}

std::shared_ptr<http_response> server_connection::answer(const http_request& request) {
    std::shared_ptr<http_response> response;
    try {
        if (handler_) response = handler_(request);
    } catch (const std::exception& e) {
        LOG_ERROR("request handler failed for {}: {}", request.request_line(), e.what());
    }
    if (!response) {
        LOG_ERROR("no response produced for {}", request.request_line());
        response = stock_reply(http_response::status::internal_server_error);
    }
    return response;
}

std::shared_ptr<http_response> server_connection::stock_reply(http_response::status status) const {
    response res(server_name_);
    res.error(status);
    return res.get_http_response();
}

}
