#include <scriptor/backends/openai_backend.h>
#include <scriptor/client.h>
#include <scriptor/exceptions.h>

namespace scriptor {

OpenAiBackend::OpenAiBackend(std::string endpoint, std::string api_key)
    : endpoint_(std::move(endpoint)), api_key_(std::move(api_key)) {}

boost::json::object OpenAiBackend::build_payload(const std::vector<Message>& messages, const GenerationParams& params) {
    boost::json::array wire_messages;
    wire_messages.reserve(messages.size());
    for (const auto& msg : messages) {
        wire_messages.push_back(boost::json::object{
            {"role", std::string(to_string(msg.role))},
            {"content", msg.content}
        });
    }

    return boost::json::object{
        {"model", params.model},
        {"messages", std::move(wire_messages)},
        {"temperature", params.temperature},
        {"max_tokens", params.max_tokens}
    };
}

Completion OpenAiBackend::parse_response(const boost::json::value& body) {
    Completion completion;
    const auto* root = body.if_object();
    if (!root) {
        return completion;
    }

    if (const auto* choices = root->if_contains("choices"); choices && choices->is_array() && !choices->as_array().empty()) {
        const auto& first = choices->as_array().front();
        if (const auto* choice = first.if_object()) {
            if (const auto* message = choice->if_contains("message"); message && message->is_object()) {
                if (const auto* content = message->as_object().if_contains("content"); content && content->is_string()) {
                    completion.content = boost::json::value_to<std::string>(*content);
                }
            }
            if (const auto* reason = choice->if_contains("finish_reason")) {
                completion.metadata["finish_reason"] = *reason;
            }
        }
    }

    if (const auto* usage = root->if_contains("usage"); usage && usage->is_object()) {
        completion.metadata["usage"] = *usage;
    }
    if (const auto* model = root->if_contains("model")) {
        completion.metadata["model"] = *model;
    }
    return completion;
}

Completion OpenAiBackend::chat(const std::vector<Message>& messages, const GenerationParams& params) {
    Headers headers{
        {"Authorization", "Bearer " + api_key_}
    };

    auto res = fetch_json_sync(join_url(endpoint_, "chat/completions"), "POST",
                               std::move(headers), build_payload(messages, params), params.timeout);

    if (!res.ok()) {
        throw TransientBackendError(
            "Chat completion returned HTTP " + std::to_string(res.status) + ": " + res.body.substr(0, 200),
            res.status);
    }

    boost::system::error_code ec;
    auto body = boost::json::parse(res.body, ec);
    if (ec) {
        throw TransientBackendError("Chat completion returned invalid JSON: " + ec.message());
    }

    auto completion = parse_response(body);
    if (!completion.metadata.contains("model")) {
        completion.metadata["model"] = params.model;
    }
    return completion;
}

} // namespace scriptor
