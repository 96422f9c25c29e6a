#include "headers.hpp"
#include "../../util/logger.hpp"

#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>

namespace hellod::http {

    std::vector<headers::http_header>::const_iterator headers::find(std::string_view key) const {
        return std::find_if(headers_.begin(), headers_.end(), [key](const http_header& entry) {
            return boost::algorithm::iequals(entry.first, key);
        });
    }

    void headers::add_header(std::string key, std::string value) {
        if (key.empty()) return;
        headers_.emplace_back(std::move(key), std::move(value));
    }

    void headers::set_header(std::string_view key, std::string value) {
        auto it = find(key);
        if (it == headers_.end()) {
            add_header(std::string(key), std::move(value));
            return;
        }
        headers_[it - headers_.cbegin()].second = std::move(value);
    }

    bool headers::has_header(std::string_view key) const {
        return find(key) != headers_.end();
    }

    const std::string& headers::get_header(std::string_view key) const {
        static const std::string missing;
        auto it = find(key);
        return it != headers_.end() ? it->second : missing;
    }

    void headers::set_http_version(uint8_t major, uint8_t minor) {
        http_version_major_ = major;
        http_version_minor_ = minor;
    }

    void headers::log(const char* scope) const {
        for (const auto& [name, value] : headers_) {
            LOG_TRACE("[{}] {}: {}", scope, name, value);
        }
    }

}
