#ifndef SCRIPTOR_BACKENDS_GEMINI_BACKEND_H
#define SCRIPTOR_BACKENDS_GEMINI_BACKEND_H

#include <scriptor/backend.h>
#include <boost/json.hpp>
#include <string>

namespace scriptor {

/**
 * @brief Gemini generateContent over HTTP(S).
 *
 * POST {endpoint}/models/{model}:generateContent?key={api_key}
 */
class GeminiBackend : public GenerateBackend {
public:
    GeminiBackend(std::string endpoint, std::string api_key);

    Completion generate(const std::string& prompt, const GenerationParams& params) override;

    static boost::json::object build_payload(const std::string& prompt, const GenerationParams& params);

    /**
     * @brief Concatenates candidates[0].content.parts[*].text.
     */
    static Completion parse_response(const boost::json::value& body);

private:
    std::string endpoint_;
    std::string api_key_;
};

} // namespace scriptor

#endif
