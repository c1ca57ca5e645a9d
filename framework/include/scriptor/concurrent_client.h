#ifndef SCRIPTOR_CONCURRENT_CLIENT_H
#define SCRIPTOR_CONCURRENT_CLIENT_H

#include <scriptor/backend.h>
#include <scriptor/config.h>
#include <scriptor/connection_pool.h>
#include <scriptor/thread_pool.h>
#include <scriptor/types.h>
#include <boost/json.hpp>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace scriptor {

/**
 * @brief Public entry point for AI calls.
 *
 * Owns a ConnectionPool and a bounded ThreadPool. Everything initializes
 * lazily on first use. Calls without a session id run on a throwaway session
 * that is released afterwards; calls with an id keep the conversation.
 */
class ConcurrentClient {
public:
    /**
     * @param factory handle factory; HttpBackendFactory over `config` when null.
     */
    explicit ConcurrentClient(ClientConfig config, std::shared_ptr<BackendFactory> factory = nullptr);
    ~ConcurrentClient();

    ConcurrentClient(const ConcurrentClient&) = delete;
    ConcurrentClient& operator=(const ConcurrentClient&) = delete;

    /**
     * @brief Initializes the pool and starts the workers. Idempotent.
     * @throws ConfigurationError
     */
    void initialize();

    /**
     * @brief Blocking send on the given or a throwaway session.
     * @throws CircuitOpenError, ExhaustedRetriesError, ConfigurationError
     */
    Response send(const std::string& message, const std::optional<std::string>& session_id = std::nullopt);

    /**
     * @brief send() on a worker thread. A rejected task yields a future holding QueueFullError.
     */
    std::future<Response> send_async(std::string message, std::optional<std::string> session_id = std::nullopt);

    /**
     * @brief Sends every message concurrently; result i belongs to message i.
     *
     * With more than one message each gets its own fresh session and
     * `session_id` is ignored. Failed or timed-out entries are std::nullopt.
     * Messages that do not fit the worker queue run on the calling thread.
     *
     * @throws ConfigurationError if the client cannot be initialized.
     */
    std::vector<std::optional<Response>> send_batch(const std::vector<std::string>& messages,
                                                    const std::optional<std::string>& session_id = std::nullopt);

    /** @brief Opens a named session for multi-turn use. */
    std::string create_session();
    void close_session(const std::string& session_id);
    std::vector<std::string> active_sessions();

    BackendKind backend_kind();

    /**
     * @brief {backend, model, max_workers, max_connections, active_sessions, pool stats}.
     */
    boost::json::object model_info();

    /**
     * @brief Stops the workers (after queued tasks) and the pool.
     */
    void shutdown();

    ConnectionPool& pool() { return pool_; }
    const ClientConfig& config() const { return config_; }

private:
    std::future<Response> submit_or_run(const std::string& message, const std::optional<std::string>& session_id);

    ClientConfig config_;
    ConnectionPool pool_;

    std::mutex init_mutex_;
    bool initialized_{false};
    std::unique_ptr<ThreadPool> workers_;
};

} // namespace scriptor

#endif
