#include <scriptor/backends/gemini_backend.h>
#include <scriptor/client.h>
#include <scriptor/exceptions.h>

namespace scriptor {

GeminiBackend::GeminiBackend(std::string endpoint, std::string api_key)
    : endpoint_(std::move(endpoint)), api_key_(std::move(api_key)) {}

boost::json::object GeminiBackend::build_payload(const std::string& prompt, const GenerationParams& params) {
    return boost::json::object{
        {"contents", boost::json::array{
            boost::json::object{
                {"role", "user"},
                {"parts", boost::json::array{ boost::json::object{{"text", prompt}} }}
            }
        }},
        {"generationConfig", boost::json::object{
            {"temperature", params.temperature},
            {"maxOutputTokens", params.max_tokens}
        }}
    };
}

Completion GeminiBackend::parse_response(const boost::json::value& body) {
    Completion completion;
    const auto* root = body.if_object();
    if (!root) {
        return completion;
    }

    if (const auto* candidates = root->if_contains("candidates");
        candidates && candidates->is_array() && !candidates->as_array().empty()) {
        if (const auto* candidate = candidates->as_array().front().if_object()) {
            if (const auto* content = candidate->if_contains("content"); content && content->is_object()) {
                if (const auto* parts = content->as_object().if_contains("parts"); parts && parts->is_array()) {
                    for (const auto& part : parts->as_array()) {
                        const auto* obj = part.if_object();
                        if (!obj) continue;
                        if (const auto* text = obj->if_contains("text"); text && text->is_string()) {
                            completion.content += boost::json::value_to<std::string>(*text);
                        }
                    }
                }
            }
            if (const auto* reason = candidate->if_contains("finishReason")) {
                completion.metadata["finish_reason"] = *reason;
            }
            if (const auto* ratings = candidate->if_contains("safetyRatings")) {
                completion.metadata["safety_ratings"] = *ratings;
            }
        }
    }

    if (const auto* usage = root->if_contains("usageMetadata"); usage && usage->is_object()) {
        completion.metadata["usage_metadata"] = *usage;
    }
    return completion;
}

Completion GeminiBackend::generate(const std::string& prompt, const GenerationParams& params) {
    const std::string url = join_url(endpoint_, "models/" + params.model + ":generateContent")
                          + "?key=" + url_encode(api_key_);

    auto res = fetch_json_sync(url, "POST", {}, build_payload(prompt, params), params.timeout);

    if (!res.ok()) {
        throw TransientBackendError(
            "generateContent returned HTTP " + std::to_string(res.status) + ": " + res.body.substr(0, 200),
            res.status);
    }

    boost::system::error_code ec;
    auto body = boost::json::parse(res.body, ec);
    if (ec) {
        throw TransientBackendError("generateContent returned invalid JSON: " + ec.message());
    }

    auto completion = parse_response(body);
    completion.metadata["model"] = params.model;
    return completion;
}

} // namespace scriptor
