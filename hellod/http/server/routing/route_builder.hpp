#ifndef HELLOD_HTTP_ROUTE_BUILDER_HPP
#define HELLOD_HTTP_ROUTE_BUILDER_HPP

#include <string>
#include <vector>
#include "route.hpp"

namespace hellod::http {

// Routes of one method, indexed by path: builder[path] = callback
class route_builder {
public:
    explicit route_builder(std::vector<route>& routes) : routes_(routes) {}

    // the route registered for the path, appended when missing
    route& operator[](const std::string& path) {
        for (auto& existing : routes_) {
            if (existing.get_path() == path) return existing;
        }
        return routes_.emplace_back(path);
    }

private:
    std::vector<route>& routes_;
};

} // namespace hellod::http

#endif // HELLOD_HTTP_ROUTE_BUILDER_HPP
