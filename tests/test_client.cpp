#include <catch2/catch_test_macros.hpp>
#include <scriptor/client.h>
#include "local_server.h"
#include <boost/asio.hpp>
#include <chrono>
#include <thread>

using namespace scriptor;
using namespace scriptor::testing;

TEST_CASE("Client: URL parsing", "[client][url]") {
    auto p = parse_url("https://api.example.com/v1/chat?x=1");
    CHECK(p.is_ssl);
    CHECK(p.host == "api.example.com");
    CHECK(p.port == "443");
    CHECK(p.target == "/v1/chat?x=1");

    auto q = parse_url("http://127.0.0.1:8080");
    CHECK_FALSE(q.is_ssl);
    CHECK(q.host == "127.0.0.1");
    CHECK(q.port == "8080");
    CHECK(q.target == "/");

    auto r = parse_url("http://host?key=abc");
    CHECK(r.host == "host");
    CHECK(r.target == "/?key=abc");
}

TEST_CASE("Client: URL helpers", "[client][url]") {
    CHECK(join_url("https://api.example.com/v1/", "chat/completions") == "https://api.example.com/v1/chat/completions");
    CHECK(join_url("https://api.example.com/v1", "/chat") == "https://api.example.com/v1/chat");

    CHECK(resolve_url("http://h:81/a/b", "/c") == "http://h:81/c");
    CHECK(resolve_url("http://h/a/b", "c") == "http://h/a/c");
    CHECK(resolve_url("http://h/a", "https://other/x") == "https://other/x");

    CHECK(url_encode("a b&c=d~") == "a%20b%26c%3Dd~");
    CHECK(form_encode({{"grant_type", "client_credentials"}, {"client_id", "x y"}}) ==
          "client_id=x%20y&grant_type=client_credentials");
}

TEST_CASE("Client: Fetch against a local server", "[client][http]") {
    LocalServer server([&](const LocalRequest& req) {
        if (req.target() == "/headers") {
            auto res = make_response(http::status::ok, R"({"status":"ok"})");
            res.insert("X-Custom-List", "Value1");
            res.insert("x-custom-list", "Value2");
            return res;
        }
        if (req.target() == "/redirect") {
            auto res = make_response(http::status::found, "moving", "text/plain");
            res.set(http::field::location, "/final");
            return res;
        }
        if (req.target() == "/final") {
            return make_response(http::status::ok, "Target Reached", "text/plain");
        }
        if (req.target() == "/echo") {
            return make_response(http::status::ok, req.body(),
                                 std::string(req[http::field::content_type]));
        }
        if (req.target() == "/slow") {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            return make_response(http::status::ok, "Too late", "text/plain");
        }
        return make_response(http::status::not_found, "missing", "text/plain");
    });

    SECTION("Case-insensitive multi-valued headers") {
        auto res = fetch_sync(server.url("/headers"));
        CHECK(res.status == 200);
        CHECK(res.ok());
        CHECK(res.get_headers("x-CUSTOM-list").size() == 2);
        CHECK(res.get_header("content-type") == "application/json");
        CHECK(res.json().as_object().at("status").as_string() == "ok");
    }

    SECTION("Redirects are followed") {
        auto res = fetch_sync(server.url("/redirect"));
        CHECK(res.status == 200);
        CHECK(res.body == "Target Reached");
    }

    SECTION("JSON bodies are posted with a content type") {
        auto res = fetch_json_sync(server.url("/echo"), "POST", {}, boost::json::object{{"n", 42}});
        CHECK(res.get_header("Content-Type") == "application/json");
        CHECK(res.json().as_object().at("n").as_int64() == 42);
    }

    SECTION("Error statuses are returned, not thrown") {
        auto res = fetch_sync(server.url("/nope"));
        CHECK(res.status == 404);
        CHECK_FALSE(res.ok());
    }

    SECTION("Timeouts throw") {
        CHECK_THROWS(fetch_sync(server.url("/slow"), "GET", {}, {}, std::chrono::milliseconds(100)));
    }

    SECTION("Coroutine API") {
        boost::asio::io_context ioc;
        auto future = boost::asio::co_spawn(ioc, fetch(server.url("/final")), boost::asio::use_future);
        ioc.run();
        CHECK(future.get().body == "Target Reached");
    }
}

TEST_CASE("Client: Connection refused throws", "[client][http]") {
    CHECK_THROWS(fetch_sync("http://127.0.0.1:1/", "GET", {}, {}, std::chrono::seconds(2)));
}
