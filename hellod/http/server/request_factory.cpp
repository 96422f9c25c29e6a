#include "request_factory.hpp"

#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>

namespace hellod::http {

    namespace {
        bool is_ctl(char c) {
            return (c >= 0 && c < 32) || c == 127;
        }

        // RFC 9110 tchar
        bool is_token_char(char c) {
            static const std::string delimiters = "\"(),/:;<=>?@[\\]{}";
            return c > 32 && c < 127 && delimiters.find(c) == std::string::npos;
        }

        bool is_token(const std::string& value) {
            return !value.empty() && std::all_of(value.begin(), value.end(), is_token_char);
        }

        bool is_digit(char c) {
            return c >= '0' && c <= '9';
        }
    }

    boost::tribool request_factory::consume(char input) {
        if (expecting_lf_) {
            if (input != '\n') return false;
            expecting_lf_ = false;
            return end_of_line();
        }
        if (input == '\r') {
            expecting_lf_ = true;
            return boost::indeterminate;
        }
        // bare LF line endings and control bytes, except tabs inside header lines
        if (is_ctl(input) && !(input == '\t' && state_ == state::header_lines)) {
            return false;
        }
        line_.push_back(input);
        return boost::indeterminate;
    }

    boost::tribool request_factory::end_of_line() {
        std::string line;
        line.swap(line_);

        if (state_ == state::request_line) {
            if (!parse_request_line(line)) return false;
            state_ = state::header_lines;
            return boost::indeterminate;
        }
        if (line.empty()) return true;
        if (!parse_header_line(line)) return false;
        return boost::indeterminate;
    }

    bool request_factory::parse_request_line(const std::string& line) {
        // method SP request-target SP HTTP-version, single spaces only
        auto first = line.find(' ');
        if (first == std::string::npos) return false;
        auto second = line.find(' ', first + 1);
        if (second == std::string::npos || line.find(' ', second + 1) != std::string::npos) return false;

        std::string method_name = line.substr(0, first);
        std::string target = line.substr(first + 1, second - first - 1);
        std::string version = line.substr(second + 1);

        if (!is_token(method_name) || target.empty()) return false;
        if (version.size() != 8 || version.compare(0, 5, "HTTP/") != 0 ||
            !is_digit(version[5]) || version[6] != '.' || !is_digit(version[7])) {
            return false;
        }

        request_->set_method(std::move(method_name));
        request_->set_uri(std::move(target));
        request_->set_http_version(static_cast<uint8_t>(version[5] - '0'),
                                   static_cast<uint8_t>(version[7] - '0'));
        return true;
    }

    bool request_factory::parse_header_line(const std::string& line) {
        // leading whitespace is obsolete line folding
        if (line.front() == ' ' || line.front() == '\t') return false;

        auto colon = line.find(':');
        if (colon == std::string::npos) return false;

        std::string name = line.substr(0, colon);
        if (!is_token(name)) return false;

        auto value = boost::algorithm::trim_copy_if(line.substr(colon + 1), boost::algorithm::is_any_of(" \t"));
        request_->add_header(std::move(name), std::move(value));
        return true;
    }

    std::shared_ptr<http_request> request_factory::consume_request() {
        auto parsed = std::move(request_);
        request_ = std::make_shared<http_request>();
        line_.clear();
        state_ = state::request_line;
        expecting_lf_ = false;
        return parsed;
    }

}
