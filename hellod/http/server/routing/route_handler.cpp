#include "route_handler.hpp"
#include "../response.hpp"
#include "../../../util/logger.hpp"

namespace hellod::http {

route_builder route_handler::operator[](method http_method) {
    return route_builder(routes_[http_method]);
}

const route* route_handler::find_route(const http_request& req) const {
    auto method_routes = routes_.find(req.get_method());
    if (method_routes == routes_.end()) {
        LOG_DEBUG("no routes for method {}", req.get_method_name());
        return nullptr;
    }
    for (const auto& candidate : method_routes->second) {
        if (candidate.matches(req.get_uri())) {
            return &candidate;
        }
    }
    LOG_DEBUG("no route matches {} {}", req.get_method_name(), req.get_uri());
    return nullptr;
}

void route_handler::send_internal_error(response& res, const std::string& message) const {
    if (res.has_responded()) {
        LOG_WARNING("handler failed after sending its response, keeping it");
        return;
    }
    if (verbose_errors_ && !message.empty()) {
        res.error(http_response::status::internal_server_error, message);
    } else {
        res.error(http_response::status::internal_server_error);
    }
}

void route_handler::handle_request(const http_request& req, response& res) const {
    const route* matched = find_route(req);
    if (!matched) {
        res.error(http_response::status::not_found);
        return;
    }

    try {
        matched->handle_request(req, res);
    } catch (const std::exception& e) {
        LOG_ERROR("route {} failed: {}", matched->get_path(), e.what());
        send_internal_error(res, e.what());
        return;
    }

    if (!res.has_responded()) {
        LOG_ERROR("route {} did not produce a response", matched->get_path());
        send_internal_error(res, "");
    }
}

} // namespace hellod::http
