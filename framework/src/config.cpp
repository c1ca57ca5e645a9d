#include <scriptor/config.h>
#include <scriptor/environment.h>
#include <scriptor/exceptions.h>
#include <cmath>

namespace scriptor {

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
    if (!exponential_backoff) {
        return retry_delay;
    }
    const double scaled = static_cast<double>(retry_delay.count()) * std::pow(backoff_factor, attempt);
    return std::chrono::milliseconds(static_cast<long long>(std::llround(scaled)));
}

BackendOptions ClientConfig::default_openai() {
    BackendOptions opts;
    opts.model_name = "gpt-3.5-turbo";
    opts.temperature = 0.1;
    return opts;
}

BackendOptions ClientConfig::default_gemini() {
    BackendOptions opts;
    opts.model_name = "gemini-1.5-flash";
    opts.api_base = "https://generativelanguage.googleapis.com/v1beta";
    opts.temperature = 0.7;
    return opts;
}

const BackendOptions& ClientConfig::options_for(BackendKind kind) const {
    switch (kind) {
        case BackendKind::OpenAI: return openai;
        case BackendKind::Gemini: return gemini;
        case BackendKind::Auto: break;
    }
    throw ConfigurationError("Backend kind must be resolved before reading its options");
}

std::string ClientConfig::endpoint_for(BackendKind kind) const {
    const auto& opts = options_for(kind);
    return opts.api_base.empty() ? credentials.base_url : opts.api_base;
}

ClientConfig ClientConfig::from_env() {
    ClientConfig cfg;

    cfg.credentials.api_key = env<std::string>("AI_API_KEY", "");
    cfg.credentials.base_url = env<std::string>("AI_API_BASE", "");

    const auto kind_text = env<std::string>("AI_BACKEND", "auto");
    const auto kind = parse_backend_kind(kind_text);
    if (!kind) {
        throw ConfigurationError("AI_BACKEND must be auto, openai or gemini, got: " + kind_text);
    }
    cfg.backend_kind = *kind;

    cfg.max_workers = env<size_t>("AI_MAX_WORKERS", cfg.max_workers);
    cfg.max_connections = env<size_t>("AI_MAX_CONNECTIONS", cfg.max_connections);

    const auto timeout = seconds_to_ms(env<double>("AI_TIMEOUT", 120.0));
    const int max_retries = env<int>("AI_MAX_RETRIES", 3);
    const auto retry_delay = seconds_to_ms(env<double>("AI_RETRY_DELAY", 1.0));

    for (BackendOptions* opts : {&cfg.openai, &cfg.gemini}) {
        opts->timeout = timeout;
        opts->retry.max_retries = max_retries;
        opts->retry.retry_delay = retry_delay;
    }

    const auto model = env<std::string>("AI_MODEL", "");
    if (!model.empty()) {
        if (cfg.backend_kind == BackendKind::Gemini) {
            cfg.gemini.model_name = model;
        } else {
            cfg.openai.model_name = model;
        }
    }

    return cfg;
}

} // namespace scriptor
