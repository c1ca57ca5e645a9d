#include <scriptor/concurrent_client.h>
#include <scriptor/exceptions.h>
#include <scriptor/logger.h>

namespace scriptor {

namespace {

// Returns a throwaway session to the pool however the call ends.
class SessionLease {
    ConnectionPool& pool_;
    std::string id_;
public:
    SessionLease(ConnectionPool& pool, std::string id) : pool_(pool), id_(std::move(id)) {}
    ~SessionLease() { pool_.release_session(id_); }

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;
};

std::shared_ptr<BackendFactory> default_factory(const ClientConfig& config,
                                                std::shared_ptr<BackendFactory> factory) {
    if (factory) {
        return factory;
    }
    return std::make_shared<HttpBackendFactory>(config);
}

}

ConcurrentClient::ConcurrentClient(ClientConfig config, std::shared_ptr<BackendFactory> factory)
    : config_(std::move(config)),
      pool_(config_, default_factory(config_, std::move(factory))) {}

ConcurrentClient::~ConcurrentClient() {
    shutdown();
}

void ConcurrentClient::initialize() {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (initialized_) {
        return;
    }

    pool_.initialize();
    workers_ = std::make_unique<ThreadPool>(config_.max_workers, config_.max_queue);
    initialized_ = true;

    Logger::instance().info("Concurrent client ready: " + std::to_string(config_.max_workers) +
                            " workers, backend " + std::string(to_string(pool_.backend_kind())));
}

Response ConcurrentClient::send(const std::string& message, const std::optional<std::string>& session_id) {
    initialize();

    auto session = pool_.get_session(session_id);
    if (session_id) {
        return session->send(message);
    }

    SessionLease lease(pool_, session->id());
    return session->send(message);
}

std::future<Response> ConcurrentClient::send_async(std::string message, std::optional<std::string> session_id) {
    try {
        initialize();

        std::lock_guard<std::mutex> lock(init_mutex_);
        if (!workers_) {
            throw QueueFullError();
        }
        return workers_->submit([this, message = std::move(message), session_id = std::move(session_id)] {
            return send(message, session_id);
        });
    } catch (const ClientError&) {
        std::promise<Response> failed;
        failed.set_exception(std::current_exception());
        return failed.get_future();
    }
}

// A full worker queue runs the message on the calling thread instead of dropping it.
std::future<Response> ConcurrentClient::submit_or_run(const std::string& message,
                                                     const std::optional<std::string>& session_id) {
    {
        std::lock_guard<std::mutex> lock(init_mutex_);
        if (workers_) {
            try {
                return workers_->submit([this, message, session_id] {
                    return send(message, session_id);
                });
            } catch (const QueueFullError&) {
                Logger::instance().debug("Worker queue full, running batch message inline");
            }
        }
    }

    std::promise<Response> inline_result;
    try {
        inline_result.set_value(send(message, session_id));
    } catch (const std::exception&) {
        inline_result.set_exception(std::current_exception());
    }
    return inline_result.get_future();
}

std::vector<std::optional<Response>> ConcurrentClient::send_batch(const std::vector<std::string>& messages,
                                                                  const std::optional<std::string>& session_id) {
    initialize();

    const bool shared_session = messages.size() == 1;

    std::vector<std::future<Response>> futures;
    futures.reserve(messages.size());
    for (const auto& message : messages) {
        futures.push_back(submit_or_run(message, shared_session ? session_id : std::nullopt));
    }

    auto& log = Logger::instance();
    std::vector<std::optional<Response>> results;
    results.reserve(futures.size());

    for (size_t i = 0; i < futures.size(); ++i) {
        auto& future = futures[i];
        if (future.wait_for(config_.batch_timeout) != std::future_status::ready) {
            log.warn("Batch message " + std::to_string(i) + " timed out");
            results.emplace_back(std::nullopt);
            continue;
        }
        try {
            results.emplace_back(future.get());
        } catch (const std::exception& e) {
            log.warn("Batch message " + std::to_string(i) + " failed: " + e.what());
            results.emplace_back(std::nullopt);
        }
    }
    return results;
}

std::string ConcurrentClient::create_session() {
    initialize();
    return pool_.get_session()->id();
}

void ConcurrentClient::close_session(const std::string& session_id) {
    pool_.release_session(session_id);
}

std::vector<std::string> ConcurrentClient::active_sessions() {
    return pool_.active_session_ids();
}

BackendKind ConcurrentClient::backend_kind() {
    initialize();
    return pool_.backend_kind();
}

boost::json::object ConcurrentClient::model_info() {
    initialize();

    const BackendKind kind = pool_.backend_kind();
    const auto stats = pool_.stats();

    return boost::json::object{
        {"backend", std::string(to_string(kind))},
        {"model", config_.options_for(kind).model_name},
        {"max_workers", config_.max_workers},
        {"max_connections", config_.max_connections},
        {"active_sessions", stats.active_sessions},
        {"available_handles", stats.available},
        {"overflow_handles", stats.overflow_handles},
        {"sessions_created", stats.sessions_created}
    };
}

void ConcurrentClient::shutdown() {
    std::unique_ptr<ThreadPool> workers;
    {
        std::lock_guard<std::mutex> lock(init_mutex_);
        workers = std::move(workers_);
    }

    // Queued tasks still run against the live pool.
    if (workers) {
        workers->stop();
    }

    std::lock_guard<std::mutex> lock(init_mutex_);
    pool_.shutdown();
    if (initialized_) {
        Logger::instance().info("Concurrent client shut down");
    }
    initialized_ = false;
}

} // namespace scriptor
