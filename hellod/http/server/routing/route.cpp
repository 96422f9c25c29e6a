#include "route.hpp"
#include "../response.hpp"

namespace hellod::http {

route& route::operator=(route_callback callback) {
    callback_ = std::move(callback);
    return *this;
}

route& route::description(std::string text) {
    description_ = std::move(text);
    return *this;
}

void route::handle_request(const http_request& req, response& res) const {
    if (callback_) callback_(req, res);
}

} // namespace hellod::http
