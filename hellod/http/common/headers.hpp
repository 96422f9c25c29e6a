#ifndef HELLOD_HTTP_HEADERS_HPP
#define HELLOD_HTTP_HEADERS_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hellod::http {

    namespace header {
        inline constexpr std::string_view connection = "Connection";
        inline constexpr std::string_view content_length = "Content-Length";
        inline constexpr std::string_view content_type = "Content-Type";
        inline constexpr std::string_view server = "Server";
    }

    /// Ordered header list shared by requests and responses. Lookups ignore
    /// case, the order of insertion is the order on the wire.
    class headers {
    public:
        using http_header = std::pair<std::string, std::string>;

        void add_header(std::string key, std::string value);

        // replaces the first header with the same name, appends otherwise
        void set_header(std::string_view key, std::string value);

        bool has_header(std::string_view key) const;

        // empty string when the header is missing
        const std::string& get_header(std::string_view key) const;

        const std::vector<http_header>& get_headers() const { return headers_; }

        void set_http_version(uint8_t major, uint8_t minor);
        int get_http_version_major() const { return http_version_major_; }
        int get_http_version_minor() const { return http_version_minor_; }

        void log(const char* scope) const;

    protected:
        std::vector<http_header>::const_iterator find(std::string_view key) const;

        std::vector<http_header> headers_;
        uint8_t http_version_major_ = 1;
        uint8_t http_version_minor_ = 1;
    };

}

#endif
