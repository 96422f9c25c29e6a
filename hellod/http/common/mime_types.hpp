#ifndef HELLOD_HTTP_MIME_TYPES_HPP
#define HELLOD_HTTP_MIME_TYPES_HPP

#include <string>

namespace hellod::http::mime_types {

    inline const std::string text_plain = "text/plain";
    inline const std::string text_html = "text/html";

}

#endif
