#include "hello_service.hpp"
#include "../http/server/http_server_base.hpp"
#include "../http/server/response.hpp"
#include "../util/logger.hpp"

namespace hellod::hello {

    hello_service::hello_service(config::server_config config) :
        config_(std::move(config))
    {

    }

    void hello_service::register_routes(http::http_server_base& server) const {
        server.get(HELLO_PATH, [](const http::http_request&, http::response& res) {
            res.send(HELLO_BODY, http::mime_types::text_plain);
        }).description("plain text greeting");
    }

    void hello_service::log_endpoints() const {
        LOG_INFO("serving GET http://{}{}", config_.bind_address(), HELLO_PATH);
    }

}
