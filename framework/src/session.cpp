#include <scriptor/session.h>
#include <scriptor/exceptions.h>
#include <scriptor/logger.h>
#include <algorithm>
#include <cctype>
#include <functional>
#include <optional>
#include <thread>

namespace scriptor {

namespace {

// Clears the in-flight flag and refreshes last-used on every exit path of send().
class CallScope {
public:
    CallScope(std::atomic<bool>& flag, std::function<void()> touch)
        : flag_(flag), touch_(std::move(touch)) {
        flag_ = true;
        touch_();
    }
    ~CallScope() {
        touch_();
        flag_ = false;
    }

    CallScope(const CallScope&) = delete;
    CallScope& operator=(const CallScope&) = delete;

private:
    std::atomic<bool>& flag_;
    std::function<void()> touch_;
};

long long elapsed_ms(Session::Clock::duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

}

Session::Session(std::string id, BackendHandle handle, BackendOptions options, SessionOptions session_options)
    : id_(std::move(id)),
      handle_(std::move(handle)),
      options_(std::move(options)),
      session_options_(std::move(session_options)),
      created_at_(Clock::now()),
      last_used_at_(created_at_) {}

void Session::touch() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_used_at_ = Clock::now();
}

Session::Clock::time_point Session::last_used_at() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_used_at_;
}

bool Session::is_expired(std::chrono::milliseconds max_idle) const {
    if (in_flight_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    return Clock::now() - last_used_at_ > max_idle;
}

std::vector<Message> Session::history() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return history_;
}

GenerationParams Session::params() const {
    GenerationParams p;
    p.model = options_.model_name;
    p.temperature = options_.temperature;
    p.max_tokens = options_.max_tokens;
    p.timeout = options_.timeout;
    return p;
}

Response Session::send(const std::string& message) {
    std::lock_guard<std::mutex> call_lock(call_mutex_);
    CallScope scope(in_flight_, [this] { touch(); });

    auto& log = Logger::instance();
    CircuitBreaker* cb = breaker();

    if (cb && !cb->can_execute()) {
        throw CircuitOpenError(std::string(to_string(cb->state())));
    }

    const auto snapshot = history();
    const int total_attempts = std::max(1, options_.retry.max_retries + 1);
    std::string last_error;

    for (int attempt = 0; attempt < total_attempts; ++attempt) {
        const auto started = Clock::now();
        std::optional<Completion> completion;

        try {
            Completion result = invoke(message, snapshot);
            const auto elapsed = Clock::now() - started;

            if (elapsed > options_.timeout) {
                throw TransientBackendError("Backend call timed out after " +
                                            std::to_string(elapsed_ms(elapsed)) + " ms");
            }
            if (result.content.empty()) {
                throw TransientBackendError("Backend returned an empty response");
            }
            completion = std::move(result);
        } catch (const ConfigurationError&) {
            throw;
        } catch (const std::exception& e) {
            last_error = e.what();
            if (cb) cb->record_failure();

            if (attempt + 1 < total_attempts) {
                const auto delay = options_.retry.delay_for(attempt);
                log.warn("Session " + id_ + " attempt " + std::to_string(attempt + 1) + "/" +
                         std::to_string(total_attempts) + " failed: " + last_error +
                         "; retrying in " + std::to_string(delay.count()) + " ms");
                std::this_thread::sleep_for(delay);
            } else {
                log.log_error("Session " + id_ + " failed after " + std::to_string(total_attempts) +
                              " attempts: " + last_error +
                              (cb ? " (breaker " + std::string(to_string(cb->state())) + ")" : std::string()));
            }
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            history_.push_back(Message::user(message));
            history_.push_back(Message::assistant(completion->content));
        }
        if (cb) cb->record_success();

        if (attempt > 0) {
            log.info("Session " + id_ + " succeeded on attempt " + std::to_string(attempt + 1));
        }

        Response response;
        response.content = std::move(completion->content);
        response.metadata = std::move(completion->metadata);
        response.metadata["attempt"] = attempt + 1;
        response.metadata["total_attempts"] = total_attempts;
        response.metadata["response_time"] =
            std::chrono::duration<double>(Clock::now() - started).count();
        if (cb) {
            response.metadata["circuit_breaker_state"] = std::string(to_string(cb->state()));
        }
        response.session_id = id_;
        response.timestamp = std::chrono::system_clock::now();
        response.backend_kind = kind();
        return response;
    }

    throw ExhaustedRetriesError(total_attempts, last_error);
}

ChatSession::ChatSession(std::string id, BackendHandle handle, BackendOptions options,
                         SessionOptions session_options, CircuitBreakerConfig breaker_config)
    : Session(std::move(id), std::move(handle), std::move(options), std::move(session_options)),
      backend_(dynamic_cast<ChatBackend*>(this->handle().backend.get())),
      breaker_(breaker_config) {
    if (!backend_) {
        throw ConfigurationError("Chat session requires a chat-protocol backend handle");
    }
}

std::vector<Message> ChatSession::build_request(const std::string& message,
                                                const std::vector<Message>& history) const {
    const auto& opts = session_options();
    std::vector<Message> request;

    if (!opts.system_prompt.empty()) {
        request.push_back(Message::system(opts.system_prompt));
    }

    const size_t keep = 2 * opts.max_history_pairs;
    auto first = history.begin();
    if (opts.compress_history && history.size() > keep) {
        const size_t dropped = history.size() - keep;
        request.push_back(Message::assistant(
            "[Conversation summary: " + std::to_string(dropped) + " earlier messages omitted]"));
        first += static_cast<std::ptrdiff_t>(dropped);
    }
    request.insert(request.end(), first, history.end());
    request.push_back(Message::user(message));
    return request;
}

Completion ChatSession::invoke(const std::string& message, const std::vector<Message>& history) {
    auto request = build_request(message, history);
    Logger::instance().debug("Session " + id() + " chat request: " + std::to_string(request.size()) +
                             " messages, ~" + std::to_string(estimate_tokens(request)) + " tokens");
    return backend_->chat(request, params());
}

GenerateSession::GenerateSession(std::string id, BackendHandle handle, BackendOptions options,
                                 SessionOptions session_options)
    : Session(std::move(id), std::move(handle), std::move(options), std::move(session_options)),
      backend_(dynamic_cast<GenerateBackend*>(this->handle().backend.get())) {
    if (!backend_) {
        throw ConfigurationError("Generate session requires a generate-protocol backend handle");
    }
}

Completion GenerateSession::invoke(const std::string& message, const std::vector<Message>&) {
    return backend_->generate(message, params());
}

size_t estimate_tokens(const std::vector<Message>& messages) {
    double tokens = 0.0;
    for (const auto& msg : messages) {
        bool in_word = false;
        bool word_is_ascii = true;
        for (unsigned char c : msg.content) {
            if (c >= 0x80) {
                // UTF-8 lead bytes start a character, continuation bytes are 10xxxxxx
                if ((c & 0xC0) != 0x80) tokens += 1.5;
                word_is_ascii = false;
                in_word = true;
            } else if (std::isspace(c)) {
                if (in_word && word_is_ascii) tokens += 1.0;
                in_word = false;
                word_is_ascii = true;
            } else {
                in_word = true;
            }
        }
        if (in_word && word_is_ascii) tokens += 1.0;
    }
    return static_cast<size_t>(tokens);
}

} // namespace scriptor
