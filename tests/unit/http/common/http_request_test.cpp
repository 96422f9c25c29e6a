#include <catch2/catch_test_macros.hpp>
#include <hellod/http/common/http_request.hpp>

using namespace hellod::http;

TEST_CASE("HTTP Request method handling", "[http][request][unit]") {

    SECTION("Method names map to the enum") {
        REQUIRE(get_method("GET") == method::GET);
        REQUIRE(get_method("HEAD") == method::HEAD);
        REQUIRE(get_method("POST") == method::POST);
        REQUIRE(get_method("PUT") == method::PUT);
        REQUIRE(get_method("DELETE") == method::DELETE);
        REQUIRE(get_method("OPTIONS") == method::OPTIONS);
        REQUIRE(get_method("PATCH") == method::PATCH);
        REQUIRE(get_method("TRACE") == method::TRACE);
        REQUIRE(get_method("CONNECT") == method::CONNECT);
    }

    SECTION("Method names are case sensitive") {
        REQUIRE(get_method("get") == method::UNKNOWN);
        REQUIRE(get_method("Get") == method::UNKNOWN);
        REQUIRE(get_method("BREW") == method::UNKNOWN);
    }

    SECTION("Enum maps back to the name") {
        REQUIRE(get_method(method::GET) == "GET");
        REQUIRE(get_method(method::DELETE) == "DELETE");
        REQUIRE(get_method(method::UNKNOWN) == "UNKNOWN");
    }
}

TEST_CASE("HTTP Request construction", "[http][request][unit]") {
    http_request request;

    SECTION("Defaults") {
        REQUIRE(request.get_method() == method::UNKNOWN);
        REQUIRE(request.get_uri().empty());
        REQUIRE(request.get_remote_ip().empty());
    }

    SECTION("Unknown method keeps its name") {
        request.set_method("BREW");
        REQUIRE(request.get_method() == method::UNKNOWN);
        REQUIRE(request.get_method_name() == "BREW");
    }

    SECTION("Request line fields") {
        request.set_method("GET");
        request.set_uri("/hello?name=x");
        request.set_remote_ip("127.0.0.1");

        REQUIRE(request.get_method() == method::GET);
        REQUIRE(request.get_method_name() == "GET");
        REQUIRE(request.get_uri() == "/hello?name=x");
        REQUIRE(request.get_remote_ip() == "127.0.0.1");
    }
}

TEST_CASE("HTTP Request line", "[http][request][unit]") {
    http_request request;
    request.set_method("GET");
    request.set_uri("/hello");
    request.add_header("Host", "localhost");

    REQUIRE(request.request_line() == "GET /hello HTTP/1.1");

    SECTION("Version and target are reported as received") {
        request.set_method("BREW");
        request.set_uri("/release-1..2");
        request.set_http_version(1, 0);
        REQUIRE(request.request_line() == "BREW /release-1..2 HTTP/1.0");
    }
}
