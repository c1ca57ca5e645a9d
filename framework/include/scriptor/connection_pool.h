#ifndef SCRIPTOR_CONNECTION_POOL_H
#define SCRIPTOR_CONNECTION_POOL_H

#include <scriptor/backend.h>
#include <scriptor/config.h>
#include <scriptor/session.h>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace scriptor {

struct PoolStats {
    size_t handles_created = 0;
    size_t overflow_handles = 0;
    size_t sessions_created = 0;
    size_t sessions_released = 0;
    size_t sessions_expired = 0;
    size_t handles_discarded = 0;
    size_t available = 0;
    size_t active_sessions = 0;
};

/**
 * @brief Bounded set of backend handles plus the map of live Sessions.
 *
 * Holds at most max_connections queued handles. When the queue is empty a
 * temporary overflow handle is created for the caller; it is dropped on
 * release instead of being queued. A background thread evicts sessions idle
 * for longer than SessionOptions::max_idle every sweep_interval.
 *
 * The pool lock covers the queue and the map only; it is never held across
 * a backend call.
 */
class ConnectionPool {
public:
    ConnectionPool(ClientConfig config, std::shared_ptr<BackendFactory> factory);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Detects the backend, creates max_connections handles and starts the sweep.
     *
     * Idempotent. Any failure leaves the pool uninitialized.
     * @throws ConfigurationError on missing credentials or no usable backend.
     */
    void initialize();

    bool initialized() const { return initialized_; }

    /**
     * @brief Returns the live session `id`, or a new one bound to a free handle.
     *
     * An expired session under `id` is evicted and replaced. Without an id a
     * fresh one is generated.
     * @throws ClientError if the pool is not initialized.
     */
    std::shared_ptr<Session> get_session(const std::optional<std::string>& id = std::nullopt);

    /**
     * @brief Forgets `id` and gives its handle back. Unknown ids are ignored.
     */
    void release_session(const std::string& id);

    /**
     * @brief One sweep pass. Returns the number of sessions evicted.
     */
    size_t sweep_expired();

    /**
     * @brief Stops the sweep thread, drops all sessions and handles.
     */
    void shutdown();

    PoolStats stats() const;
    size_t available() const;
    std::vector<std::string> active_session_ids() const;
    BackendKind backend_kind() const;
    const ClientConfig& config() const { return config_; }

private:
    std::shared_ptr<Backend> create_handle();
    std::shared_ptr<Session> make_session(std::string id, BackendHandle handle) const;
    std::string next_session_id();
    void release_locked(const std::string& id);
    void sweep_loop();

    ClientConfig config_;
    std::shared_ptr<BackendFactory> factory_;

    std::mutex init_mutex_;
    std::atomic<bool> initialized_{false};

    mutable std::mutex mutex_;
    BackendKind kind_{BackendKind::Auto};
    std::deque<std::shared_ptr<Backend>> available_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    PoolStats stats_;
    uint64_t id_counter_{0};

    std::thread sweeper_;
    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    bool stopping_{false};
};

} // namespace scriptor

#endif
