#ifndef HELLOD_HTTP_REQUEST_HPP
#define HELLOD_HTTP_REQUEST_HPP

#include <string>
#include <string_view>
#include "headers.hpp"

namespace hellod::http {

    enum class method {
        GET,
        HEAD,
        POST,
        PUT,
        DELETE,
        OPTIONS,
        PATCH,
        TRACE,
        CONNECT,
        UNKNOWN
    };

    // names are case-sensitive, anything unrecognized is method::UNKNOWN
    method get_method(std::string_view name);
    const std::string& get_method(method value);

    /// Parsed request head. The target is kept exactly as received.
    class http_request : public headers {
    public:
        void set_method(std::string name);
        method get_method() const { return method_; }
        const std::string& get_method_name() const { return method_name_; }

        void set_uri(std::string uri) { uri_ = std::move(uri); }
        const std::string& get_uri() const { return uri_; }

        void set_remote_ip(std::string remote_ip) { remote_ip_ = std::move(remote_ip); }
        const std::string& get_remote_ip() const { return remote_ip_; }

        /// "METHOD target HTTP/x.y", as it appears in the access log
        std::string request_line() const;

        void log(const char* scope) const;

    private:
        method method_ = method::UNKNOWN;
        std::string method_name_;
        std::string uri_;
        std::string remote_ip_;
    };

}

#endif
