#ifndef HELLOD_HTTP_REQUEST_FACTORY_HPP
#define HELLOD_HTTP_REQUEST_FACTORY_HPP

#include <memory>
#include <string>
#include <boost/logic/tribool.hpp>
#include "../common/http_request.hpp"

namespace hellod::http {

    /// Incremental parser for the request head: the request line and the
    /// CRLF-framed header lines up to the blank line. Bodies are never read.
    class request_factory {
    public:
        /// Feed bytes from begin to end. True once the blank line ending the
        /// headers was consumed, false on malformed input, indeterminate while
        /// more input is needed. begin is left just past the consumed bytes.
        template<typename InputIterator>
        boost::tribool parse(InputIterator& begin, InputIterator end) {
            while (begin != end) {
                boost::tribool result = consume(static_cast<char>(*begin++));
                if (!boost::indeterminate(result)) return result;
            }
            return boost::indeterminate;
        }

        /// Take the parsed request and reset for the next one.
        std::shared_ptr<http_request> consume_request();

    private:
        boost::tribool consume(char input);
        boost::tribool end_of_line();

        bool parse_request_line(const std::string& line);
        bool parse_header_line(const std::string& line);

        enum class state {
            request_line,
            header_lines
        };

        std::shared_ptr<http_request> request_ = std::make_shared<http_request>();
        std::string line_;
        state state_ = state::request_line;
        bool expecting_lf_ = false;
    };

}

#endif // HELLOD_HTTP_REQUEST_FACTORY_HPP
