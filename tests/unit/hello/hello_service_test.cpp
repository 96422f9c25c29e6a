#include <catch2/catch_test_macros.hpp>
#include <hellod/hello/hello_service.hpp>
#include <hellod/http/server/server_standalone.hpp>

using namespace hellod;

namespace {

    std::shared_ptr<http::http_response> dispatch(http::http_server_base& server, const std::string& method_name, const std::string& uri) {
        http::http_request request;
        request.set_method(method_name);
        request.set_uri(uri);
        return server.dispatch(request);
    }

}

TEST_CASE("Hello service registers GET /hello", "[hello][unit]") {
    http::server server;
    server.set_request_logging(false);
    hello::hello_service service{config::server_config{}};
    service.register_routes(server);

    SECTION("GET /hello answers the greeting") {
        auto res = dispatch(server, "GET", "/hello");
        REQUIRE(res->get_status_code() == 200);
        REQUIRE(res->get_content() == "Hello world");
        REQUIRE(res->get_header("Content-Type") == "text/plain");
        REQUIRE(res->to_string() ==
                "HTTP/1.1 200 OK\r\n"
                "Connection: Close\r\n"
                "Server: hellod/1.0\r\n"
                "Content-Length: 11\r\n"
                "Content-Type: text/plain\r\n"
                "\r\n"
                "Hello world");
    }

    SECTION("Responses are identical and never shared") {
        auto first = dispatch(server, "GET", "/hello");
        auto second = dispatch(server, "GET", "/hello");
        REQUIRE(first != second);
        REQUIRE(first->to_string() == second->to_string());
        REQUIRE(server.requests_handled() == 2);
    }

    SECTION("Other methods are not found") {
        REQUIRE(dispatch(server, "POST", "/hello")->get_status_code() == 404);
        REQUIRE(dispatch(server, "DELETE", "/hello")->get_status_code() == 404);
    }

    SECTION("Targets are matched verbatim") {
        for (const auto* target : {"/hello/", "/hello?x=1", "/hello..world", "/%zz", "*"}) {
            CAPTURE(target);
            REQUIRE(dispatch(server, "GET", target)->get_status_code() == 404);
        }
    }

    SECTION("Other paths are not found") {
        auto res = dispatch(server, "GET", "/");
        REQUIRE(res->get_status_code() == 404);
        REQUIRE(res->get_content() ==
                "<html><head><title>Not Found</title></head><body><h1>404 Not Found</h1></body></html>");
    }
}

TEST_CASE("Hello service keeps its configuration", "[hello][unit]") {
    config::server_config config;
    config.host = "127.0.0.1";
    config.port = 8080;

    hello::hello_service service(config);
    REQUIRE(service.get_config() == config);
    REQUIRE(service.get_config().bind_address() == "127.0.0.1:8080");
}
