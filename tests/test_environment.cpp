#include <catch2/catch_test_macros.hpp>
#include <scriptor/environment.h>
#include <scriptor/config.h>
#include <scriptor/types.h>
#include <fstream>
#include <cstdio>
#include <cstdlib>

using namespace scriptor;

namespace {

void clear_ai_env() {
    for (const char* key : {"AI_API_KEY", "AI_API_BASE", "AI_BACKEND", "AI_MODEL", "AI_MAX_WORKERS",
                            "AI_MAX_CONNECTIONS", "AI_TIMEOUT", "AI_MAX_RETRIES", "AI_RETRY_DELAY"}) {
        ::unsetenv(key);
    }
}

}

TEST_CASE("Environment: .env Loading", "[env]") {
    std::string test_file = "test.env";

    std::ofstream out(test_file);
    out << "KEY1=VALUE1\n";
    out << "  KEY2 = VALUE2  \n";
    out << "# COMMENT=BLAH\n";
    out << "KEY3=\"QUOTED VALUE\"\n";
    out << "export KEY4='single'\r\n";
    out << "KEY5=plain # trailing note\n";
    out << "=novalue\n";
    out.close();

    SECTION("Loading and Parsing") {
        REQUIRE(load_env(test_file) == true);

        CHECK(std::string(std::getenv("KEY1")) == "VALUE1");
        CHECK(std::string(std::getenv("KEY2")) == "VALUE2");
        CHECK(std::getenv("COMMENT") == nullptr);
        CHECK(std::string(std::getenv("KEY3")) == "QUOTED VALUE");
        CHECK(std::string(std::getenv("KEY4")) == "single");
        CHECK(std::string(std::getenv("KEY5")) == "plain");
    }

    SECTION("Non-existent file") {
        CHECK(load_env("missing.env") == false);
    }

    std::remove(test_file.c_str());
}

TEST_CASE("Environment: Typed lookup", "[env]") {
    ::setenv("SCRIPTOR_T_INT", "42", 1);
    ::setenv("SCRIPTOR_T_DOUBLE", "2.5", 1);
    ::setenv("SCRIPTOR_T_BOOL", "yes", 1);
    ::setenv("SCRIPTOR_T_BAD", "many", 1);
    ::unsetenv("SCRIPTOR_T_MISSING");

    CHECK(env<int>("SCRIPTOR_T_INT") == 42);
    CHECK(env<size_t>("SCRIPTOR_T_INT") == 42u);
    CHECK(env<double>("SCRIPTOR_T_DOUBLE") == 2.5);
    CHECK(env<bool>("SCRIPTOR_T_BOOL"));
    CHECK(env<std::string>("SCRIPTOR_T_MISSING", "fallback") == "fallback");
    CHECK(env<int>("SCRIPTOR_T_MISSING", 7) == 7);

    CHECK_THROWS_AS(env<std::string>("SCRIPTOR_T_MISSING"), ConfigurationError);
    CHECK_THROWS_AS(env<int>("SCRIPTOR_T_BAD"), ConfigurationError);
}

TEST_CASE("Config: Defaults from an empty environment", "[env][config]") {
    clear_ai_env();

    auto cfg = ClientConfig::from_env();
    CHECK(cfg.backend_kind == BackendKind::Auto);
    CHECK(cfg.credentials.api_key.empty());
    CHECK(cfg.max_workers == 5);
    CHECK(cfg.max_connections == 10);
    CHECK(cfg.openai.model_name == "gpt-3.5-turbo");
    CHECK(cfg.gemini.model_name == "gemini-1.5-flash");
    CHECK(cfg.openai.timeout == std::chrono::seconds(120));
    CHECK(cfg.gemini.retry.max_retries == 3);
}

TEST_CASE("Config: Environment overrides", "[env][config]") {
    clear_ai_env();
    ::setenv("AI_API_KEY", "sk-env", 1);
    ::setenv("AI_API_BASE", "https://proxy.example.com/v1", 1);
    ::setenv("AI_BACKEND", "Gemini", 1);
    ::setenv("AI_MODEL", "gemini-pro", 1);
    ::setenv("AI_MAX_WORKERS", "8", 1);
    ::setenv("AI_TIMEOUT", "2.5", 1);
    ::setenv("AI_RETRY_DELAY", "0.25", 1);
    ::setenv("AI_MAX_RETRIES", "1", 1);

    auto cfg = ClientConfig::from_env();
    CHECK(cfg.credentials.api_key == "sk-env");
    CHECK(cfg.backend_kind == BackendKind::Gemini);
    CHECK(cfg.gemini.model_name == "gemini-pro");
    CHECK(cfg.openai.model_name == "gpt-3.5-turbo");
    CHECK(cfg.max_workers == 8);
    CHECK(cfg.openai.timeout == std::chrono::milliseconds(2500));
    CHECK(cfg.gemini.retry.retry_delay == std::chrono::milliseconds(250));
    CHECK(cfg.openai.retry.max_retries == 1);

    CHECK(cfg.endpoint_for(BackendKind::OpenAI) == "https://proxy.example.com/v1");
    CHECK(cfg.endpoint_for(BackendKind::Gemini) == "https://generativelanguage.googleapis.com/v1beta");

    ::setenv("AI_BACKEND", "claude", 1);
    CHECK_THROWS_AS(ClientConfig::from_env(), ConfigurationError);

    clear_ai_env();
}

TEST_CASE("Config: Retry delays", "[config]") {
    RetryPolicy policy;
    policy.retry_delay = std::chrono::milliseconds(100);

    CHECK(policy.delay_for(0) == std::chrono::milliseconds(100));
    CHECK(policy.delay_for(1) == std::chrono::milliseconds(200));
    CHECK(policy.delay_for(3) == std::chrono::milliseconds(800));

    policy.exponential_backoff = false;
    CHECK(policy.delay_for(3) == std::chrono::milliseconds(100));
}

TEST_CASE("Config: Backend kind names", "[config]") {
    CHECK(parse_backend_kind("OpenAI") == BackendKind::OpenAI);
    CHECK(parse_backend_kind("gemini") == BackendKind::Gemini);
    CHECK(parse_backend_kind("AUTO") == BackendKind::Auto);
    CHECK_FALSE(parse_backend_kind("llama").has_value());
    CHECK(to_string(BackendKind::Gemini) == "gemini");
    CHECK_THROWS_AS(ClientConfig{}.options_for(BackendKind::Auto), ConfigurationError);
}
