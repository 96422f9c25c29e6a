#ifndef HELLOD_HTTP_SERVER_BASE_HPP
#define HELLOD_HTTP_SERVER_BASE_HPP

#include "routing/route_handler.hpp"
#include "routing/route.hpp"
#include "../common/http_request.hpp"
#include "../common/http_response.hpp"
#include "../../asio/tcp_socket_server.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace hellod::http {

/**
 * Route table plus listener. Derived servers decide which io_context runs the
 * connections and how wait() blocks.
 */
class http_server_base {
public:
    static constexpr const char* DEFAULT_SERVER_NAME = "hellod/1.0";

    http_server_base() = default;
    virtual ~http_server_base() = default;

    // register a GET route, returned for chaining .description()
    route& get(const std::string& path, route_callback handler);

    // one access log line per answered request
    void set_request_logging(bool enabled) { log_requests_ = enabled; }

    // exception messages in 500 bodies
    void set_verbose_errors(bool enabled) { router_.set_verbose_errors(enabled); }

    void set_server_name(std::string server_name) { server_name_ = std::move(server_name); }

    // bind and start accepting, false with last_error() set on failure
    virtual bool listen(const std::string& host, uint16_t port);

    virtual bool stop();

    // block until the server is stopped
    virtual void wait() = 0;

    virtual boost::asio::io_context& get_io_context() = 0;

    bool is_listening() const;

    // port assigned after listen(), useful with port 0
    uint16_t local_port() const;

    const boost::system::error_code& last_error() const { return last_error_; }

    // requests that reached the route table
    unsigned long requests_handled() const { return requests_handled_; }

    // route a parsed request, always returns a response
    std::shared_ptr<http_response> dispatch(const http_request& request);

private:
    void accept(std::shared_ptr<asio::tcp_socket> socket);
    void log_request(const std::string& remote_ip, const http_request* request, const http_response& response) const;

    route_handler router_;
    std::shared_ptr<asio::tcp_socket_server> socket_server_;
    std::string server_name_ = DEFAULT_SERVER_NAME;
    std::atomic<bool> log_requests_{true};
    std::atomic<unsigned long> requests_handled_{0};
    boost::system::error_code last_error_;
};

} // namespace hellod::http

#endif // HELLOD_HTTP_SERVER_BASE_HPP
