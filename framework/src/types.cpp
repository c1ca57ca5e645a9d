#include <scriptor/types.h>
#include <algorithm>
#include <cctype>

namespace scriptor {

std::string_view to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::Auto:   return "auto";
        case BackendKind::OpenAI: return "openai";
        case BackendKind::Gemini: return "gemini";
    }
    return "unknown";
}

std::optional<BackendKind> parse_backend_kind(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "auto" || lowered.empty()) return BackendKind::Auto;
    if (lowered == "openai") return BackendKind::OpenAI;
    if (lowered == "gemini") return BackendKind::Gemini;
    return std::nullopt;
}

std::string_view to_string(Role role) {
    switch (role) {
        case Role::System:    return "system";
        case Role::User:      return "user";
        case Role::Assistant: return "assistant";
    }
    return "unknown";
}

} // namespace scriptor
