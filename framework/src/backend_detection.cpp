#include <scriptor/backend_detection.h>
#include <scriptor/environment.h>
#include <scriptor/exceptions.h>
#include <scriptor/logger.h>
#include <algorithm>
#include <cctype>

namespace scriptor {

namespace {

bool looks_openai_compatible(std::string base) {
    std::transform(base.begin(), base.end(), base.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return base.find("/v1") != std::string::npos || base.find("openai") != std::string::npos;
}

}

std::vector<DetectionRule> default_detection_rules() {
    return {
        {"explicit override", [](const ClientConfig& cfg) -> std::optional<BackendKind> {
            if (cfg.backend_kind != BackendKind::Auto) return cfg.backend_kind;
            return std::nullopt;
        }},
        {"openai credentials", [](const ClientConfig& cfg) -> std::optional<BackendKind> {
            if (cfg.openai.enabled && !cfg.credentials.api_key.empty() &&
                !cfg.endpoint_for(BackendKind::OpenAI).empty()) {
                return BackendKind::OpenAI;
            }
            return std::nullopt;
        }},
        {"gemini credentials", [](const ClientConfig& cfg) -> std::optional<BackendKind> {
            if (cfg.gemini.enabled && !cfg.credentials.api_key.empty() &&
                !cfg.endpoint_for(BackendKind::Gemini).empty()) {
                return BackendKind::Gemini;
            }
            return std::nullopt;
        }},
        {"environment", [](const ClientConfig&) -> std::optional<BackendKind> {
            const auto base = env<std::string>("AI_API_BASE", "");
            const auto key = env<std::string>("AI_API_KEY", "");
            if (!base.empty() && looks_openai_compatible(base)) return BackendKind::OpenAI;
            if (!key.empty()) return BackendKind::Gemini;
            return std::nullopt;
        }}
    };
}

BackendKind detect_backend_kind(const ClientConfig& config, const std::vector<DetectionRule>& rules) {
    for (const auto& rule : rules) {
        if (auto kind = rule.apply(config)) {
            Logger::instance().info("Backend detected by rule '" + rule.name + "': " +
                                    std::string(to_string(*kind)));
            return *kind;
        }
    }

    throw ConfigurationError(
        "No usable AI backend. openai enabled: " + std::string(config.openai.enabled ? "yes" : "no") +
        ", gemini enabled: " + std::string(config.gemini.enabled ? "yes" : "no") +
        ", api key set: " + std::string(config.credentials.api_key.empty() ? "no" : "yes"));
}

} // namespace scriptor
