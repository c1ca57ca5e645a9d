#ifndef SCRIPTOR_BACKENDS_OPENAI_BACKEND_H
#define SCRIPTOR_BACKENDS_OPENAI_BACKEND_H

#include <scriptor/backend.h>
#include <boost/json.hpp>
#include <string>
#include <vector>

namespace scriptor {

/**
 * @brief OpenAI-compatible chat completions over HTTP(S).
 *
 * POST {endpoint}/chat/completions with a bearer token.
 */
class OpenAiBackend : public ChatBackend {
public:
    OpenAiBackend(std::string endpoint, std::string api_key);

    Completion chat(const std::vector<Message>& messages, const GenerationParams& params) override;

    const std::string& endpoint() const { return endpoint_; }

    static boost::json::object build_payload(const std::vector<Message>& messages, const GenerationParams& params);

    /**
     * @brief Extracts choices[0].message.content plus usage/model/finish_reason.
     * A missing or null content yields an empty Completion::content.
     */
    static Completion parse_response(const boost::json::value& body);

private:
    std::string endpoint_;
    std::string api_key_;
};

} // namespace scriptor

#endif
