#include <catch2/catch_test_macros.hpp>
#include <scriptor/concurrent_client.h>
#include <scriptor/client_registry.h>
#include <scriptor/exceptions.h>
#include "fake_backend.h"
#include <atomic>
#include <cstdint>
#include <thread>

using namespace scriptor;
using namespace scriptor::testing;

namespace {

// Fails every message containing "bad", echoes the rest.
Script selective_script() {
    return [](const std::string& msg) {
        if (msg.find("bad") != std::string::npos) {
            throw TransientBackendError("rejected");
        }
        return reply("echo: " + msg);
    };
}

}

TEST_CASE("ConcurrentClient: Lazy initialization", "[client]") {
    auto factory = std::make_shared<FakeBackendFactory>();
    ConcurrentClient client(test_config(), factory);

    CHECK(factory->created.load() == 0);
    auto res = client.send("hello");
    CHECK(res.content == "echo: hello");
    CHECK(factory->created.load() == 2);
}

TEST_CASE("ConcurrentClient: Anonymous sends release their session", "[client]") {
    ConcurrentClient client(test_config(), std::make_shared<FakeBackendFactory>());

    client.send("one");
    client.send("two");
    CHECK(client.active_sessions().empty());
    CHECK(client.pool().available() == 2);
}

TEST_CASE("ConcurrentClient: Anonymous sessions are released after failures too", "[client]") {
    ConcurrentClient client(test_config(), std::make_shared<FakeBackendFactory>(selective_script()));

    CHECK_THROWS_AS(client.send("bad request"), ExhaustedRetriesError);
    CHECK(client.active_sessions().empty());
    CHECK(client.pool().available() == 2);
}

TEST_CASE("ConcurrentClient: Named sessions keep the conversation", "[client]") {
    ConcurrentClient client(test_config(), std::make_shared<FakeBackendFactory>());

    const auto id = client.create_session();
    client.send("first", id);
    auto res = client.send("second", id);

    CHECK(res.session_id == id);
    REQUIRE(client.active_sessions().size() == 1);
    CHECK(client.pool().get_session(id)->history().size() == 4);

    client.close_session(id);
    CHECK(client.active_sessions().empty());
    CHECK(client.pool().available() == 2);
}

TEST_CASE("ConcurrentClient: Async send", "[client]") {
    ConcurrentClient client(test_config(), std::make_shared<FakeBackendFactory>());

    auto f1 = client.send_async("a");
    auto f2 = client.send_async("b");
    CHECK(f1.get().content == "echo: a");
    CHECK(f2.get().content == "echo: b");
}

TEST_CASE("ConcurrentClient: Async failure surfaces from the future", "[client]") {
    ConcurrentClient client(test_config(), std::make_shared<FakeBackendFactory>(selective_script()));

    auto f = client.send_async("bad");
    CHECK_THROWS_AS(f.get(), ExhaustedRetriesError);
}

TEST_CASE("ConcurrentClient: Configuration errors surface from the future", "[client]") {
    auto cfg = test_config();
    cfg.credentials.api_key.clear();
    ConcurrentClient client(cfg, std::make_shared<FakeBackendFactory>());

    auto f = client.send_async("x");
    CHECK_THROWS_AS(f.get(), ConfigurationError);
}

TEST_CASE("ConcurrentClient: Batch surfaces configuration errors", "[client]") {
    auto cfg = test_config();
    cfg.credentials.api_key.clear();
    ConcurrentClient client(cfg, std::make_shared<FakeBackendFactory>());

    CHECK_THROWS_AS(client.send_batch({"a", "b"}), ConfigurationError);
}

TEST_CASE("ConcurrentClient: Batch larger than the worker queue", "[client]") {
    auto cfg = test_config().workers(1);
    cfg.max_queue = 2;
    ConcurrentClient client(cfg, std::make_shared<FakeBackendFactory>([](const std::string& msg) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return reply("echo: " + msg);
    }));

    std::vector<std::string> messages;
    for (int i = 0; i < 10; ++i) {
        messages.push_back("m" + std::to_string(i));
    }
    auto results = client.send_batch(messages);

    REQUIRE(results.size() == 10);
    for (size_t i = 0; i < results.size(); ++i) {
        REQUIRE(results[i].has_value());
        CHECK(results[i]->content == "echo: m" + std::to_string(i));
    }
    CHECK(client.active_sessions().empty());
}

TEST_CASE("ConcurrentClient: Batch keeps positions and isolates failures", "[client]") {
    ConcurrentClient client(test_config(), std::make_shared<FakeBackendFactory>(selective_script()));

    auto results = client.send_batch({"q0", "bad q1", "q2", "q3"});

    REQUIRE(results.size() == 4);
    REQUIRE(results[0].has_value());
    CHECK(results[0]->content == "echo: q0");
    CHECK_FALSE(results[1].has_value());
    REQUIRE(results[2].has_value());
    CHECK(results[2]->content == "echo: q2");
    REQUIRE(results[3].has_value());
    CHECK(results[3]->content == "echo: q3");

    // Each message ran on its own throwaway session.
    CHECK(results[0]->session_id != results[2]->session_id);
    CHECK(client.active_sessions().empty());
}

TEST_CASE("ConcurrentClient: Batch of one uses the given session", "[client]") {
    ConcurrentClient client(test_config(), std::make_shared<FakeBackendFactory>());
    const auto id = client.create_session();

    auto results = client.send_batch({"solo"}, id);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].has_value());
    CHECK(results[0]->session_id == id);
    CHECK(client.active_sessions().size() == 1);

    SECTION("Larger batches ignore the id") {
        auto many = client.send_batch({"x", "y"}, id);
        REQUIRE(many[0].has_value());
        REQUIRE(many[1].has_value());
        CHECK(many[0]->session_id != id);
        CHECK(many[1]->session_id != id);
    }
}

TEST_CASE("ConcurrentClient: Batch timeouts become empty entries", "[client]") {
    auto cfg = test_config();
    cfg.batch_timeout = std::chrono::milliseconds(50);
    ConcurrentClient client(cfg, std::make_shared<FakeBackendFactory>([](const std::string& msg) {
        if (msg == "slow") {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
        }
        return reply(msg);
    }));

    auto results = client.send_batch({"fast", "slow"});
    REQUIRE(results.size() == 2);
    CHECK(results[0].has_value());
    CHECK_FALSE(results[1].has_value());
}

TEST_CASE("ConcurrentClient: Introspection", "[client]") {
    ConcurrentClient client(test_config(BackendKind::Gemini), std::make_shared<FakeBackendFactory>());

    CHECK(client.backend_kind() == BackendKind::Gemini);

    auto info = client.model_info();
    CHECK(info.at("backend").as_string() == "gemini");
    CHECK(info.at("model").as_string() == "gemini-1.5-flash");
    CHECK(info.at("max_connections").to_number<int64_t>() == 2);
    CHECK(info.at("active_sessions").to_number<int64_t>() == 0);
}

TEST_CASE("ConcurrentClient: Shutdown then reuse", "[client]") {
    auto factory = std::make_shared<FakeBackendFactory>();
    ConcurrentClient client(test_config(), factory);
    client.send("before");

    client.shutdown();
    CHECK_FALSE(client.pool().initialized());

    auto res = client.send("after");
    CHECK(res.content == "echo: after");
    CHECK(factory->created.load() == 4);
}

TEST_CASE("ClientRegistry: One shared client until reset", "[client][registry]") {
    auto factory = std::make_shared<FakeBackendFactory>();
    int builds = 0;
    ClientRegistry registry([&builds] { ++builds; return test_config(); }, factory);

    CHECK_FALSE(registry.has_client());

    auto a = registry.get();
    auto b = registry.get();
    CHECK(a.get() == b.get());
    CHECK(builds == 1);
    CHECK(a->send("hi").content == "echo: hi");

    registry.reset();
    CHECK_FALSE(registry.has_client());
    CHECK_FALSE(a->pool().initialized());

    auto c = registry.get();
    CHECK(c.get() != a.get());
    CHECK(builds == 2);
}

TEST_CASE("ClientRegistry: Concurrent first use builds once", "[client][registry]") {
    std::atomic<int> builds{0};
    ClientRegistry registry([&builds] { ++builds; return test_config(); },
                            std::make_shared<FakeBackendFactory>());

    std::vector<std::thread> threads;
    std::vector<ConcurrentClient*> seen(8);
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&, i] { seen[i] = registry.get().get(); });
    }
    for (auto& t : threads) t.join();

    CHECK(builds.load() == 1);
    for (auto* p : seen) {
        CHECK(p == seen.front());
    }
}

TEST_CASE("ClientRegistry: Failed initialization keeps nothing", "[client][registry]") {
    ClientRegistry registry([] {
        auto cfg = test_config();
        cfg.credentials.api_key.clear();
        return cfg;
    }, std::make_shared<FakeBackendFactory>());

    CHECK_THROWS_AS(registry.get(), ConfigurationError);
    CHECK_FALSE(registry.has_client());
}
