#include "http_server_base.hpp"
#include "server_connection.hpp"
#include "response.hpp"
#include "../../util/logger.hpp"

namespace hellod::http {

route& http_server_base::get(const std::string& path, route_callback handler) {
    return router_[method::GET][path] = std::move(handler);
}

bool http_server_base::listen(const std::string& host, uint16_t port) {
    last_error_.clear();

    auto socket_server = std::make_shared<asio::tcp_socket_server>(get_io_context());
    socket_server->set_handler([this](std::shared_ptr<asio::tcp_socket> socket) {
        accept(std::move(socket));
    });

    if (!socket_server->start(host, std::to_string(port))) {
        last_error_ = socket_server->last_error();
        return false;
    }
    socket_server_ = std::move(socket_server);

    for (const auto& [http_method, routes] : router_.get_routes()) {
        for (const auto& registered : routes) {
            LOG_DEBUG("route {} {} ({})", get_method(http_method), registered.get_path(), registered.get_description());
        }
    }
    return true;
}

bool http_server_base::stop() {
    if (!socket_server_) return false;
    socket_server_->stop();
    socket_server_.reset();
    return true;
}

bool http_server_base::is_listening() const {
    return socket_server_ && socket_server_->is_running();
}

uint16_t http_server_base::local_port() const {
    return socket_server_ ? socket_server_->local_port() : 0;
}

std::shared_ptr<http_response> http_server_base::dispatch(const http_request& request) {
    response res(server_name_);
    router_.handle_request(request, res);
    ++requests_handled_;
    return res.get_http_response();
}

void http_server_base::accept(std::shared_ptr<asio::tcp_socket> socket) {
    auto connection = std::make_shared<server_connection>(std::move(socket), server_name_);
    connection->set_handler([this](const http_request& request) {
        return dispatch(request);
    });
    connection->set_access_log([this](const std::string& remote_ip, const http_request* request, const http_response& response) {
        if (log_requests_) log_request(remote_ip, request, response);
    });
    connection->start();
}

void http_server_base::log_request(const std::string& remote_ip, const http_request* request, const http_response& response) const {
    // unparseable heads have no request line
    LOG_INFO("{} - \"{}\" {}", remote_ip, request ? request->request_line() : std::string("-"), response.get_status_code());
}

} // namespace hellod::http
