#include "http_response.hpp"
#include "mime_types.hpp"
#include "../../util/logger.hpp"

#include <algorithm>
#include <boost/asio/buffers_iterator.hpp>
#include <spdlog/fmt/fmt.h>

namespace hellod::http {

    namespace {
        const std::string crlf = "\r\n";
        const std::string header_separator = ": ";

        struct status_text {
            http_response::status value;
            std::string status_line;
            std::string stock_page;
        };

        status_text make_status_text(http_response::status value, const char* reason) {
            const auto code = static_cast<int>(value);
            return {
                value,
                fmt::format("HTTP/1.1 {} {}", code, reason),
                fmt::format("<html><head><title>{1}</title></head><body><h1>{0} {1}</h1></body></html>", code, reason)
            };
        }

        const std::vector<status_text>& status_texts() {
            static const std::vector<status_text> texts{
                make_status_text(http_response::status::ok, "OK"),
                make_status_text(http_response::status::bad_request, "Bad Request"),
                make_status_text(http_response::status::not_found, "Not Found"),
                make_status_text(http_response::status::internal_server_error, "Internal Server Error")
            };
            return texts;
        }

        const status_text& lookup(http_response::status value) {
            const auto& texts = status_texts();
            auto it = std::find_if(texts.begin(), texts.end(),
                                   [value](const status_text& text) { return text.value == value; });
            return it != texts.end() ? *it : texts.back();
        }
    }

    void http_response::to_buffer(std::vector<boost::asio::const_buffer>& buffer) const {
        buffer.emplace_back(boost::asio::buffer(lookup(status_).status_line));
        buffer.emplace_back(boost::asio::buffer(crlf));
        for (const auto& [name, value] : headers_) {
            buffer.emplace_back(boost::asio::buffer(name));
            buffer.emplace_back(boost::asio::buffer(header_separator));
            buffer.emplace_back(boost::asio::buffer(value));
            buffer.emplace_back(boost::asio::buffer(crlf));
        }
        buffer.emplace_back(boost::asio::buffer(crlf));
        if (!content_.empty()) {
            buffer.emplace_back(boost::asio::buffer(content_));
        }
    }

    std::string http_response::to_string() const {
        std::vector<boost::asio::const_buffer> buffers;
        to_buffer(buffers);
        return std::string(boost::asio::buffers_begin(buffers), boost::asio::buffers_end(buffers));
    }

    void http_response::set_content(std::string content, const std::string& content_type) {
        content_ = std::move(content);
        set_header(header::content_length, std::to_string(content_.size()));
        set_header(header::content_type, content_type);
    }

    void http_response::log(const char* scope) const {
        LOG_DEBUG("[{}] {} ({} bytes)", scope, lookup(status_).status_line, content_.size());
        headers::log(scope);
    }

    std::shared_ptr<http_response> http_response::stock_http_reply(status value) {
        auto reply = std::make_shared<http_response>();
        reply->set_status(value);
        reply->set_content(lookup(value).stock_page, mime_types::text_html);
        return reply;
    }

}
