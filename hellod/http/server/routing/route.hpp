#ifndef HELLOD_HTTP_ROUTE_HPP
#define HELLOD_HTTP_ROUTE_HPP

#include <functional>
#include <string>
#include "../../common/http_request.hpp"

namespace hellod::http {

class response;

// Handlers answer through the response builder, the request is read only
using route_callback = std::function<void(const http_request&, response&)>;

// A route matches the request target exactly: no parameters, no trailing
// slash folding and no query stripping. "/hello" does not match "/hello/",
// "/HELLO" or "/hello?x=1".
class route {
public:
    explicit route(std::string path) : path_(std::move(path)) {}

    route& operator=(route_callback callback);

    // shown when the registered endpoints are logged
    route& description(std::string text);

    bool matches(const std::string& target) const { return target == path_; }

    void handle_request(const http_request& req, response& res) const;

    const std::string& get_path() const { return path_; }
    const std::string& get_description() const { return description_; }

private:
    std::string path_;
    std::string description_;
    route_callback callback_;
};

} // namespace hellod::http

#endif // HELLOD_HTTP_ROUTE_HPP
