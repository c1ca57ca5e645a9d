#ifndef SCRIPTOR_CONFIG_H
#define SCRIPTOR_CONFIG_H

#include <scriptor/types.h>
#include <scriptor/util/circuit_breaker.h>
#include <chrono>
#include <cstddef>
#include <string>

namespace scriptor {

struct RetryPolicy {
    int max_retries = 3;                                   // attempts = max_retries + 1
    std::chrono::milliseconds retry_delay{1000};
    bool exponential_backoff = true;
    double backoff_factor = 2.0;

    /**
     * @brief Sleep before the next attempt after `attempt` (0-based) failed.
     */
    std::chrono::milliseconds delay_for(int attempt) const;
};

struct BackendOptions {
    bool enabled = true;
    std::string model_name;
    std::string api_base;                                  // overrides Credentials::base_url when set
    double temperature = 0.7;
    int max_tokens = 1048576;
    std::chrono::milliseconds timeout{std::chrono::seconds(120)};
    RetryPolicy retry;
};

struct SessionOptions {
    std::chrono::milliseconds max_idle{std::chrono::hours(1)};
    size_t max_history_pairs = 5;
    bool compress_history = true;
    std::string system_prompt;                             // chat backends only, omitted when empty
};

struct Credentials {
    std::string api_key;
    std::string base_url;
};

/**
 * @brief Everything the AI client stack needs, supplied by the application.
 */
struct ClientConfig {
    size_t max_workers = 5;
    size_t max_connections = 10;
    size_t max_queue = 1024;
    BackendKind backend_kind = BackendKind::Auto;

    BackendOptions openai = default_openai();
    BackendOptions gemini = default_gemini();

    CircuitBreakerConfig circuit_breaker;
    SessionOptions session;
    Credentials credentials;

    std::chrono::milliseconds sweep_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds batch_timeout{std::chrono::seconds(60)};

    ClientConfig& workers(size_t n) { max_workers = n; return *this; }
    ClientConfig& connections(size_t n) { max_connections = n; return *this; }
    ClientConfig& backend(BackendKind kind) { backend_kind = kind; return *this; }
    ClientConfig& api_key(std::string key) { credentials.api_key = std::move(key); return *this; }
    ClientConfig& base_url(std::string url) { credentials.base_url = std::move(url); return *this; }

    const BackendOptions& options_for(BackendKind kind) const;

    /**
     * @brief Endpoint for `kind`: the backend's own api_base, else the shared base_url.
     */
    std::string endpoint_for(BackendKind kind) const;

    /**
     * @brief Defaults overlaid with the AI_* environment variables.
     * Call load_env() first to pick up a .env file.
     */
    static ClientConfig from_env();

    static BackendOptions default_openai();
    static BackendOptions default_gemini();
};

} // namespace scriptor

#endif
