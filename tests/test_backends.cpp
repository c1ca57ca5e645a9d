#include <catch2/catch_test_macros.hpp>
#include <scriptor/backend.h>
#include <scriptor/backends/openai_backend.h>
#include <scriptor/backends/gemini_backend.h>
#include <scriptor/exceptions.h>
#include "local_server.h"

using namespace scriptor;
using namespace scriptor::testing;

namespace {

GenerationParams params_for(std::string model) {
    GenerationParams params;
    params.model = std::move(model);
    params.temperature = 0.1;
    params.max_tokens = 256;
    params.timeout = std::chrono::seconds(5);
    return params;
}

const char* kChatReply = R"({
    "model": "gpt-test",
    "choices": [{"message": {"role": "assistant", "content": "Hello there"}, "finish_reason": "stop"}],
    "usage": {"prompt_tokens": 5, "completion_tokens": 2}
})";

const char* kGenerateReply = R"({
    "candidates": [{
        "content": {"parts": [{"text": "Part one. "}, {"text": "Part two."}]},
        "finishReason": "STOP"
    }],
    "usageMetadata": {"totalTokenCount": 9}
})";

}

TEST_CASE("OpenAiBackend: Payload shape", "[backend][openai]") {
    auto payload = OpenAiBackend::build_payload(
        {Message::system("be brief"), Message::user("hi")}, params_for("gpt-test"));

    CHECK(payload.at("model").as_string() == "gpt-test");
    CHECK(payload.at("max_tokens").as_int64() == 256);
    const auto& messages = payload.at("messages").as_array();
    REQUIRE(messages.size() == 2);
    CHECK(messages[0].as_object().at("role").as_string() == "system");
    CHECK(messages[1].as_object().at("content").as_string() == "hi");
}

TEST_CASE("OpenAiBackend: Response parsing", "[backend][openai]") {
    auto completion = OpenAiBackend::parse_response(boost::json::parse(kChatReply));
    CHECK(completion.content == "Hello there");
    CHECK(completion.metadata.at("finish_reason").as_string() == "stop");
    CHECK(completion.metadata.at("usage").as_object().at("completion_tokens").as_int64() == 2);
    CHECK(completion.metadata.at("model").as_string() == "gpt-test");

    SECTION("Null content is empty, not an error") {
        auto empty = OpenAiBackend::parse_response(
            boost::json::parse(R"({"choices":[{"message":{"content":null}}]})"));
        CHECK(empty.content.empty());
    }

    SECTION("Unexpected shapes are empty") {
        CHECK(OpenAiBackend::parse_response(boost::json::parse("[]")).content.empty());
        CHECK(OpenAiBackend::parse_response(boost::json::parse(R"({"choices":[]})")).content.empty());
    }
}

TEST_CASE("GeminiBackend: Payload and response", "[backend][gemini]") {
    auto payload = GeminiBackend::build_payload("summarize", params_for("gemini-test"));
    const auto& parts = payload.at("contents").as_array()[0].as_object().at("parts").as_array();
    CHECK(parts[0].as_object().at("text").as_string() == "summarize");
    CHECK(payload.at("generationConfig").as_object().at("maxOutputTokens").as_int64() == 256);

    auto completion = GeminiBackend::parse_response(boost::json::parse(kGenerateReply));
    CHECK(completion.content == "Part one. Part two.");
    CHECK(completion.metadata.at("finish_reason").as_string() == "STOP");
    CHECK(completion.metadata.contains("usage_metadata"));
}

TEST_CASE("Backends: Calls against a local server", "[backend][http]") {
    LocalServer server([](const LocalRequest& req) {
        const std::string target(req.target());
        if (target == "/v1/chat/completions") {
            return make_response(http::status::ok, kChatReply);
        }
        if (target.rfind("/v1/models/gemini-test:generateContent", 0) == 0) {
            return make_response(http::status::ok, kGenerateReply);
        }
        if (target.rfind("/down", 0) == 0) {
            return make_response(http::status::service_unavailable, "overloaded", "text/plain");
        }
        return make_response(http::status::ok, "not json", "text/plain");
    });

    SECTION("Chat completion") {
        OpenAiBackend backend(server.url("/v1"), "sk-test");
        auto completion = backend.chat({Message::user("hi")}, params_for("gpt-test"));
        CHECK(completion.content == "Hello there");

        auto seen = server.requests();
        REQUIRE(seen.size() == 1);
        CHECK(seen[0][http::field::authorization] == "Bearer sk-test");
        CHECK(boost::json::parse(seen[0].body()).as_object().at("messages").as_array().size() == 1);
    }

    SECTION("Generate content") {
        GeminiBackend backend(server.url("/v1/"), "g key");
        auto completion = backend.generate("prompt", params_for("gemini-test"));
        CHECK(completion.content == "Part one. Part two.");
        CHECK(completion.metadata.at("model").as_string() == "gemini-test");

        auto seen = server.requests();
        REQUIRE(seen.size() == 1);
        CHECK(seen[0].target() == "/v1/models/gemini-test:generateContent?key=g%20key");
    }

    SECTION("Error status is transient and carries the status") {
        OpenAiBackend backend(server.url("/down"), "sk-test");
        try {
            backend.chat({Message::user("hi")}, params_for("gpt-test"));
            FAIL("chat should have thrown");
        } catch (const TransientBackendError& e) {
            REQUIRE(e.status().has_value());
            CHECK(*e.status() == 503);
        }
    }

    SECTION("Invalid JSON is transient") {
        GeminiBackend backend(server.url("/other"), "k");
        CHECK_THROWS_AS(backend.generate("prompt", params_for("m")), TransientBackendError);
    }
}

TEST_CASE("HttpBackendFactory: Builds the matching protocol", "[backend]") {
    ClientConfig cfg;
    cfg.api_key("k").base_url("http://127.0.0.1:1/v1");
    HttpBackendFactory factory(cfg);

    CHECK(std::dynamic_pointer_cast<OpenAiBackend>(factory.create(BackendKind::OpenAI)) != nullptr);
    CHECK(std::dynamic_pointer_cast<GeminiBackend>(factory.create(BackendKind::Gemini)) != nullptr);
    CHECK_THROWS_AS(factory.create(BackendKind::Auto), ConfigurationError);

    SECTION("Missing key") {
        HttpBackendFactory keyless(ClientConfig{}.base_url("http://x/v1"));
        CHECK_THROWS_AS(keyless.create(BackendKind::OpenAI), ConfigurationError);
    }

    SECTION("Missing endpoint") {
        HttpBackendFactory no_base(ClientConfig{}.api_key("k"));
        CHECK_THROWS_AS(no_base.create(BackendKind::OpenAI), ConfigurationError);
    }
}
