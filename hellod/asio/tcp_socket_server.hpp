#ifndef HELLOD_ASIO_TCP_SOCKET_SERVER_HPP
#define HELLOD_ASIO_TCP_SOCKET_SERVER_HPP

#include "tcp_socket.hpp"

#include <functional>
#include <memory>
#include <string>
#include <boost/asio/steady_timer.hpp>
#include <boost/noncopyable.hpp>

namespace hellod::asio {

/**
 * Listening socket. start() binds synchronously so bind failures are reported
 * to the caller, then an accept loop hands every connection to the handler on
 * the io_context thread.
 */
class tcp_socket_server : public std::enable_shared_from_this<tcp_socket_server>, private boost::noncopyable {
public:
    using connection_handler = std::function<void(std::shared_ptr<tcp_socket>)>;

    explicit tcp_socket_server(boost::asio::io_context& io_context);
    ~tcp_socket_server();

    void set_handler(connection_handler handler) { handler_ = std::move(handler); }

    // resolve, bind and listen, false with last_error() set on failure
    bool start(const std::string& host, const std::string& port);

    // close the acceptor, the accept loop ends on the io_context thread
    void stop();

    bool is_running() const { return running_; }

    // bound port, 0 when not listening
    uint16_t local_port() const;

    const boost::system::error_code& last_error() const { return last_error_; }

private:
    bool bind(const std::string& host, const std::string& port);
    awaitable<void> accept_loop();

    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::steady_timer retry_timer_;
    connection_handler handler_;
    std::string bind_address_;
    bool running_ = false;
    boost::system::error_code last_error_;
};

} // namespace hellod::asio

#endif // HELLOD_ASIO_TCP_SOCKET_SERVER_HPP
