#include <scriptor/backend.h>
#include <scriptor/backends/openai_backend.h>
#include <scriptor/backends/gemini_backend.h>
#include <scriptor/exceptions.h>

namespace scriptor {

std::shared_ptr<Backend> HttpBackendFactory::create(BackendKind kind) {
    if (kind == BackendKind::Auto) {
        throw ConfigurationError("Cannot create a backend before its kind is detected");
    }
    if (config_.credentials.api_key.empty()) {
        throw ConfigurationError("API key is not set (AI_API_KEY)");
    }

    const std::string endpoint = config_.endpoint_for(kind);
    if (endpoint.empty()) {
        throw ConfigurationError("No endpoint for " + std::string(to_string(kind)) +
                                 " backend (set api_base or AI_API_BASE)");
    }

    if (kind == BackendKind::OpenAI) {
        return std::make_shared<OpenAiBackend>(endpoint, config_.credentials.api_key);
    }
    return std::make_shared<GeminiBackend>(endpoint, config_.credentials.api_key);
}

} // namespace scriptor
