#ifndef HELLOD_HTTP_SERVER_RESPONSE_HPP
#define HELLOD_HTTP_SERVER_RESPONSE_HPP

#include "../common/http_response.hpp"
#include "../common/mime_types.hpp"
#include <memory>
#include <stdexcept>
#include <string>

namespace hellod::http {

/**
 * Response builder handed to route handlers. A handler answers exactly once;
 * the connection collects the built response after the handler returns.
 * Every response carries Connection: Close and, when configured, the Server
 * header, ahead of the content headers.
 */
class response {
public:
    explicit response(std::string server_name = {})
        : server_name_(std::move(server_name)) {}

    void send(std::string body, const std::string& content_type = mime_types::text_plain) {
        auto res = start_response();
        res->set_content(std::move(body), content_type);
        respond(std::move(res));
    }

    // stock HTML page, or a plain text body when a message is given
    void error(http_response::status status, const std::string& message = "") {
        if (message.empty()) {
            auto res = http_response::stock_http_reply(status);
            stamp(*res);
            respond(std::move(res));
            return;
        }
        auto res = start_response();
        res->set_status(status);
        res->set_content(message, mime_types::text_plain);
        respond(std::move(res));
    }

    bool has_responded() const {
        return response_ != nullptr;
    }

    // null until the handler responded
    std::shared_ptr<http_response> get_http_response() const {
        return response_;
    }

private:
    void stamp(http_response& res) const {
        res.set_header(header::connection, "Close");
        if (!server_name_.empty()) {
            res.set_header(header::server, server_name_);
        }
    }

    std::shared_ptr<http_response> start_response() const {
        auto res = std::make_shared<http_response>();
        stamp(*res);
        return res;
    }

    void respond(std::shared_ptr<http_response> res) {
        if (response_) {
            throw std::runtime_error("Response already sent");
        }
        response_ = std::move(res);
    }

    std::string server_name_;
    std::shared_ptr<http_response> response_;
};

} // namespace hellod::http

#endif // HELLOD_HTTP_SERVER_RESPONSE_HPP
