#ifndef HELLOD_HTTP_RESPONSE_HPP
#define HELLOD_HTTP_RESPONSE_HPP

#include <memory>
#include <string>
#include <vector>
#include <boost/asio/buffer.hpp>
#include "headers.hpp"

namespace hellod::http {

/// Response as written by a connection. Only the statuses the server can
/// produce are representable.
class http_response : public headers {
public:
    enum class status {
        ok = 200,
        bad_request = 400,
        not_found = 404,
        internal_server_error = 500
    };

    // status line, headers and body, referencing this response's storage
    void to_buffer(std::vector<boost::asio::const_buffer>& buffer) const;

    // the exact bytes to_buffer describes
    std::string to_string() const;

    // body with its Content-Length and Content-Type headers
    void set_content(std::string content, const std::string& content_type);

    void set_status(status value) { status_ = value; }
    status get_status() const { return status_; }
    int get_status_code() const { return static_cast<int>(status_); }

    const std::string& get_content() const { return content_; }

    void log(const char* scope) const;

    // HTML error page for the status, without connection headers
    static std::shared_ptr<http_response> stock_http_reply(status value);

private:
    std::string content_;
    status status_ = status::ok;
};

}

#endif
