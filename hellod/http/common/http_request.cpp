#include "http_request.hpp"
#include "../../util/logger.hpp"

#include <algorithm>
#include <array>

namespace hellod::http {

    namespace {
        struct method_name {
            method value;
            std::string name;
        };

        const std::array<method_name, 9> method_names{{
            {method::GET, "GET"},
            {method::HEAD, "HEAD"},
            {method::POST, "POST"},
            {method::PUT, "PUT"},
            {method::DELETE, "DELETE"},
            {method::OPTIONS, "OPTIONS"},
            {method::PATCH, "PATCH"},
            {method::TRACE, "TRACE"},
            {method::CONNECT, "CONNECT"}
        }};

        const std::string unknown_method = "UNKNOWN";
    }

    method get_method(std::string_view name) {
        auto it = std::find_if(method_names.begin(), method_names.end(),
                               [name](const method_name& entry) { return entry.name == name; });
        return it != method_names.end() ? it->value : method::UNKNOWN;
    }

    const std::string& get_method(method value) {
        auto it = std::find_if(method_names.begin(), method_names.end(),
                               [value](const method_name& entry) { return entry.value == value; });
        return it != method_names.end() ? it->name : unknown_method;
    }

    void http_request::set_method(std::string name) {
        method_ = http::get_method(name);
        method_name_ = std::move(name);
    }

    std::string http_request::request_line() const {
        return method_name_ + " " + uri_ + " HTTP/" +
               std::to_string(http_version_major_) + "." + std::to_string(http_version_minor_);
    }

    void http_request::log(const char* scope) const {
        LOG_DEBUG("[{}] {} from {}", scope, request_line(), remote_ip_);
        headers::log(scope);
    }

}
