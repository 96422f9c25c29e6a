#ifndef HELLOD_HTTP_ROUTE_HANDLER_HPP
#define HELLOD_HTTP_ROUTE_HANDLER_HPP

#include <map>
#include <string>
#include <vector>
#include "route.hpp"
#include "route_builder.hpp"
#include "../../common/http_request.hpp"

namespace hellod::http {

/**
 * Route table keyed by (method, exact path). Every request leaves with a
 * response: unmatched requests get the stock 404 page, whether the path is
 * unknown or only the method differs, and a handler that throws or never
 * answers gets a 500.
 */
class route_handler {
public:
    // routes of one method, handler[method::GET]["/hello"] = callback
    route_builder operator[](method http_method);

    void handle_request(const http_request& req, response& res) const;

    // matching route, without running it
    const route* find_route(const http_request& req) const;

    // put exception messages in 500 bodies
    void set_verbose_errors(bool verbose) { verbose_errors_ = verbose; }

    const std::map<method, std::vector<route>>& get_routes() const { return routes_; }

private:
    void send_internal_error(response& res, const std::string& message) const;

    std::map<method, std::vector<route>> routes_;
    bool verbose_errors_ = false;
};

} // namespace hellod::http

#endif // HELLOD_HTTP_ROUTE_HANDLER_HPP
