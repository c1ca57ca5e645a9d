#ifndef SCRIPTOR_BACKEND_H
#define SCRIPTOR_BACKEND_H

#include <scriptor/types.h>
#include <scriptor/config.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace scriptor {

/**
 * @brief Per-call knobs handed to a backend.
 */
struct GenerationParams {
    std::string model;
    double temperature = 0.7;
    int max_tokens = 1048576;
    std::chrono::milliseconds timeout{std::chrono::seconds(120)};
};

/**
 * @brief A raw handle to the remote inference service.
 *
 * Handles are pooled by ConnectionPool and used by at most one Session at a
 * time, so implementations need not be thread-safe. Transport problems are
 * reported by throwing; an empty Completion::content is a valid return and is
 * judged by the Session.
 */
class Backend {
public:
    virtual ~Backend() = default;

    virtual BackendKind kind() const = 0;
};

/**
 * @brief Multi-turn protocol: the whole role-tagged message list is sent on every call.
 */
class ChatBackend : public Backend {
public:
    BackendKind kind() const override { return BackendKind::OpenAI; }

    virtual Completion chat(const std::vector<Message>& messages, const GenerationParams& params) = 0;
};

/**
 * @brief Single-prompt protocol.
 */
class GenerateBackend : public Backend {
public:
    BackendKind kind() const override { return BackendKind::Gemini; }

    virtual Completion generate(const std::string& prompt, const GenerationParams& params) = 0;
};

/**
 * @brief Creates raw handles for ConnectionPool.
 *
 * Called under the pool lock, so create() must not perform network I/O.
 */
class BackendFactory {
public:
    virtual ~BackendFactory() = default;

    virtual std::shared_ptr<Backend> create(BackendKind kind) = 0;
};

/**
 * @brief Production factory: HTTP backends built from ClientConfig.
 */
class HttpBackendFactory : public BackendFactory {
public:
    explicit HttpBackendFactory(ClientConfig config) : config_(std::move(config)) {}

    /**
     * @throws ConfigurationError when the key or endpoint for `kind` is missing.
     */
    std::shared_ptr<Backend> create(BackendKind kind) override;

private:
    ClientConfig config_;
};

} // namespace scriptor

#endif
