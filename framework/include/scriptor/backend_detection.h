#ifndef SCRIPTOR_BACKEND_DETECTION_H
#define SCRIPTOR_BACKEND_DETECTION_H

#include <scriptor/config.h>
#include <scriptor/types.h>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace scriptor {

/**
 * @brief One step of backend detection. Returns a kind to stop, nullopt to fall through.
 */
struct DetectionRule {
    std::string name;
    std::function<std::optional<BackendKind>(const ClientConfig&)> apply;
};

/**
 * @brief explicit override -> OpenAI credentials -> Gemini credentials -> environment.
 */
std::vector<DetectionRule> default_detection_rules();

/**
 * @brief Evaluates `rules` in order; the first match wins.
 * @throws ConfigurationError if no rule matches.
 */
BackendKind detect_backend_kind(const ClientConfig& config,
                                const std::vector<DetectionRule>& rules = default_detection_rules());

} // namespace scriptor

#endif
