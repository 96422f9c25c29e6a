#ifndef HELLOD_TEST_SERVER_FIXTURE_HPP
#define HELLOD_TEST_SERVER_FIXTURE_HPP

#include <hellod/hello/hello_service.hpp>
#include <hellod/http/server/server_standalone.hpp>
#include <hellod/http/server/response.hpp>
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <thread>
#include "raw_http_client.hpp"

namespace hellod::test {

// Test server fixture that serves the hello routes on a loopback ephemeral port
struct TestServerFixture {
    http::server server;
    config::server_config config;
    hello::hello_service service;
    uint16_t port = 0;
    std::thread server_thread;  // Thread to run the server

    TestServerFixture() : service(make_config()) {
        service.register_routes(server);

        // failing endpoint, only used to check the 500 path
        server.get("/test/throw", [](const http::http_request&, http::response&) {
            throw std::runtime_error("test handler failure");
        });

        start_server();
    }

    virtual ~TestServerFixture() {
        server.stop();
        if (server_thread.joinable()) {
            server_thread.join();
        }
    }

    raw_http_client client() const {
        return raw_http_client(port);
    }

private:
    static config::server_config make_config() {
        config::server_config config;
        config.host = "127.0.0.1";
        return config;
    }

    void start_server() {
        // port 0 lets the OS pick a free port
        if (!server.listen(service.get_config().host, 0)) {
            FAIL("Could not start test server: " + server.last_error().message());
        }
        port = server.local_port();
        config = service.get_config();
        config.port = port;

        // Start server thread
        server_thread = std::thread([this]() {
            server.wait();  // This runs io_context.run() in the thread
        });
    }
};

} // namespace hellod::test

#endif // HELLOD_TEST_SERVER_FIXTURE_HPP
