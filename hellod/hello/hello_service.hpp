#ifndef HELLOD_HELLO_SERVICE_HPP
#define HELLOD_HELLO_SERVICE_HPP

#include <string>
#include "../config/server_config.hpp"

namespace hellod::http {
    class http_server_base;
}

namespace hellod::hello {

    inline const std::string HELLO_PATH = "/hello";
    inline const std::string HELLO_BODY = "Hello world";

    /**
     * Owns the /hello endpoint. The configuration is captured at construction
     * and never read again from the environment.
     */
    class hello_service {
    public:
        explicit hello_service(config::server_config config);

        // register GET /hello on the server route table
        void register_routes(http::http_server_base& server) const;

        // log the endpoints served on the configured bind address
        void log_endpoints() const;

        const config::server_config& get_config() const { return config_; }

    private:
        const config::server_config config_;
    };

}

#endif
