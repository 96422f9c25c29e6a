#include <catch2/catch_test_macros.hpp>
#include <hellod/http/server/response.hpp>
#include <stdexcept>

using namespace hellod::http;

TEST_CASE("Response builder send", "[response][unit]") {
    response res("hellod/1.0");

    REQUIRE_FALSE(res.has_responded());
    REQUIRE(res.get_http_response() == nullptr);

    res.send("Hello world");

    REQUIRE(res.has_responded());
    auto http_res = res.get_http_response();
    REQUIRE(http_res != nullptr);
    REQUIRE(http_res->get_status_code() == 200);
    REQUIRE(http_res->get_header("Content-Type") == "text/plain");
    REQUIRE(http_res->get_header("Server") == "hellod/1.0");
    REQUIRE(http_res->get_header("Connection") == "Close");

    // connection headers come first
    const auto& all = http_res->get_headers();
    REQUIRE(all.size() == 4);
    REQUIRE(all[0].first == "Connection");
    REQUIRE(all[1].first == "Server");
}

TEST_CASE("Response builder sends only once", "[response][unit]") {
    response res;
    res.send("first");

    REQUIRE_THROWS_AS(res.send("second"), std::runtime_error);
    REQUIRE_THROWS_AS(res.error(http_response::status::not_found), std::runtime_error);
    REQUIRE(res.get_http_response()->get_content() == "first");
}

TEST_CASE("Response builder without server name", "[response][unit]") {
    response res;
    res.send("<p>hi</p>", mime_types::text_html);
    REQUIRE_FALSE(res.get_http_response()->has_header("Server"));
    REQUIRE(res.get_http_response()->get_header("Content-Type") == "text/html");
}

TEST_CASE("Response builder errors", "[response][unit]") {

    SECTION("Stock page without message") {
        response res("hellod/1.0");
        res.error(http_response::status::not_found);

        auto http_res = res.get_http_response();
        REQUIRE(http_res->get_status_code() == 404);
        REQUIRE(http_res->get_header("Content-Type") == "text/html");
        REQUIRE(http_res->get_header("Server") == "hellod/1.0");
        REQUIRE(http_res->get_header("Connection") == "Close");
    }

    SECTION("Plain text with message") {
        response res;
        res.error(http_response::status::internal_server_error, "boom");

        auto http_res = res.get_http_response();
        REQUIRE(http_res->get_status_code() == 500);
        REQUIRE(http_res->get_header("Content-Type") == "text/plain");
        REQUIRE(http_res->get_content() == "boom");
    }
}
