#ifndef SCRIPTOR_SESSION_H
#define SCRIPTOR_SESSION_H

#include <scriptor/backend.h>
#include <scriptor/config.h>
#include <scriptor/types.h>
#include <scriptor/util/circuit_breaker.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace scriptor {

/**
 * @brief A raw backend handle as checked out of the ConnectionPool.
 *
 * Temporary handles were created on overflow and are never queued again.
 */
struct BackendHandle {
    std::shared_ptr<Backend> backend;
    bool temporary = false;
};

/**
 * @brief One stateful conversation bound to one backend handle.
 *
 * send() is serialized per session: concurrent callers of the same session
 * queue up behind each other. Retry, backoff and breaker bookkeeping live here;
 * subclasses only perform the wire call.
 */
class Session {
public:
    using Clock = std::chrono::steady_clock;

    Session(std::string id, BackendHandle handle, BackendOptions options, SessionOptions session_options);
    virtual ~Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Sends one user message and waits for the reply.
     *
     * @throws CircuitOpenError if the session's breaker rejects the call.
     * @throws ExhaustedRetriesError once every attempt has failed.
     * @throws ConfigurationError from the backend, without retrying.
     */
    Response send(const std::string& message);

    /**
     * @brief True when idle for longer than `max_idle`. Never true mid-call.
     */
    bool is_expired(std::chrono::milliseconds max_idle) const;

    /** @brief Marks the session as used now. */
    void touch();

    /** @brief Copy of every (user, assistant) turn so far. */
    std::vector<Message> history() const;

    const std::string& id() const { return id_; }
    virtual BackendKind kind() const = 0;
    Clock::time_point created_at() const { return created_at_; }
    Clock::time_point last_used_at() const;
    const BackendHandle& handle() const { return handle_; }
    const BackendOptions& options() const { return options_; }

    /** @brief The owned breaker, or nullptr for variants without one. */
    virtual CircuitBreaker* breaker() { return nullptr; }

protected:
    /**
     * @brief Performs exactly one backend call. Throw on any transport problem.
     * @param history the conversation before this message.
     */
    virtual Completion invoke(const std::string& message, const std::vector<Message>& history) = 0;

    GenerationParams params() const;

    const SessionOptions& session_options() const { return session_options_; }

private:
    std::string id_;
    BackendHandle handle_;
    BackendOptions options_;
    SessionOptions session_options_;
    Clock::time_point created_at_;

    std::mutex call_mutex_;
    mutable std::mutex state_mutex_;
    Clock::time_point last_used_at_;
    std::vector<Message> history_;
    std::atomic<bool> in_flight_{false};
};

/**
 * @brief Multi-turn variant: the (compacted) history travels with every call.
 */
class ChatSession : public Session {
public:
    /**
     * @throws ConfigurationError if the handle does not speak the chat protocol.
     */
    ChatSession(std::string id, BackendHandle handle, BackendOptions options,
                SessionOptions session_options, CircuitBreakerConfig breaker_config);

    BackendKind kind() const override { return BackendKind::OpenAI; }
    CircuitBreaker* breaker() override { return &breaker_; }

    /**
     * @brief The messages actually sent upstream for `message`.
     *
     * Once history holds more than max_history_pairs pairs, only the last
     * 2 * max_history_pairs messages are kept, preceded by one summary turn
     * standing in for the dropped ones. The stored history is not modified.
     */
    std::vector<Message> build_request(const std::string& message, const std::vector<Message>& history) const;

protected:
    Completion invoke(const std::string& message, const std::vector<Message>& history) override;

private:
    ChatBackend* backend_;
    CircuitBreaker breaker_;
};

/**
 * @brief Single-prompt variant: each call carries only the new message.
 */
class GenerateSession : public Session {
public:
    GenerateSession(std::string id, BackendHandle handle, BackendOptions options, SessionOptions session_options);

    BackendKind kind() const override { return BackendKind::Gemini; }

protected:
    Completion invoke(const std::string& message, const std::vector<Message>& history) override;

private:
    GenerateBackend* backend_;
};

/**
 * @brief Rough token count: non-ASCII characters weigh 1.5, ASCII words 1.
 */
size_t estimate_tokens(const std::vector<Message>& messages);

} // namespace scriptor

#endif
