#ifndef HELLOD_SERVER_HTTP_SERVER_CONNECTION_HPP
#define HELLOD_SERVER_HTTP_SERVER_CONNECTION_HPP

#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <boost/asio/steady_timer.hpp>
#include <boost/noncopyable.hpp>
#include "request_factory.hpp"
#include "../common/http_request.hpp"
#include "../common/http_response.hpp"
#include "../../asio/tcp_socket.hpp"
#include "../../util/types.hpp"

namespace hellod::http {

/**
 * One request per connection: read the request head, answer it, close.
 * Malformed or oversized heads are answered with 400 without reaching the
 * request handler.
 */
class server_connection : public std::enable_shared_from_this<server_connection>, private boost::noncopyable {

    static constexpr size_t MAX_BUFFER_SIZE = 4096;
    static constexpr size_t MAX_HEADER_SIZE = 16 * 1024;

public:
    static constexpr auto DEFAULT_TIMEOUT = std::chrono::seconds{120};

    // builds the response for a parsed request
    using request_callback = std::function<std::shared_ptr<http_response>(const http_request&)>;

    // called once per written response, request is null when the head could not be parsed
    using access_log_callback = std::function<void(const std::string& remote_ip,
                                                   const http_request* request,
                                                   const http_response& response)>;

    server_connection(std::shared_ptr<asio::tcp_socket> socket, std::string server_name);

    void set_handler(request_callback handler) { handler_ = std::move(handler); }
    void set_access_log(access_log_callback access_log) { access_log_ = std::move(access_log); }

    // spawn the connection coroutine on the socket executor
    void start(std::chrono::seconds timeout = DEFAULT_TIMEOUT);

private:
    struct exchange {
        std::shared_ptr<http_request> request;
        std::shared_ptr<http_response> response;
    };

    awaitable<void> serve();
    awaitable<exchange> read_request();
    std::shared_ptr<http_response> answer(const http_request& request);
    std::shared_ptr<http_response> stock_reply(http_response::status status) const;

    void arm_timeout();
    void close();

    std::shared_ptr<asio::tcp_socket> socket_;
    std::string server_name_;
    boost::asio::steady_timer timeout_timer_;
    std::chrono::seconds timeout_{DEFAULT_TIMEOUT};

    std::array<uint8_t, MAX_BUFFER_SIZE> buffer_{};
    request_factory parser_;

    request_callback handler_;
    access_log_callback access_log_;
};

}

#endif
