#include <scriptor/connection_pool.h>
#include <scriptor/backend_detection.h>
#include <scriptor/exceptions.h>
#include <scriptor/logger.h>
#include <chrono>

namespace scriptor {

ConnectionPool::ConnectionPool(ClientConfig config, std::shared_ptr<BackendFactory> factory)
    : config_(std::move(config)), factory_(std::move(factory)) {
    if (!factory_) {
        throw ConfigurationError("Connection pool requires a backend factory");
    }
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

std::shared_ptr<Backend> ConnectionPool::create_handle() {
    auto handle = factory_->create(kind_);
    if (!handle) {
        throw ConfigurationError("Backend factory returned no handle for " + std::string(to_string(kind_)));
    }
    return handle;
}

void ConnectionPool::initialize() {
    std::lock_guard<std::mutex> init_lock(init_mutex_);
    if (initialized_) {
        return;
    }

    if (config_.credentials.api_key.empty()) {
        throw ConfigurationError("API key is not set (AI_API_KEY)");
    }

    const BackendKind kind = detect_backend_kind(config_);

    std::deque<std::shared_ptr<Backend>> handles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        kind_ = kind;
        for (size_t i = 0; i < config_.max_connections; ++i) {
            handles.push_back(create_handle());
        }
        available_ = std::move(handles);
        stats_.handles_created += available_.size();
    }

    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        stopping_ = false;
    }
    sweeper_ = std::thread([this] { sweep_loop(); });

    initialized_ = true;
    Logger::instance().info("Connection pool ready: " + std::to_string(config_.max_connections) +
                            " " + std::string(to_string(kind)) + " handles");
}

std::string ConnectionPool::next_session_id() {
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "session_" + std::to_string(++id_counter_) + "_" + std::to_string(now);
}

std::shared_ptr<Session> ConnectionPool::make_session(std::string id, BackendHandle handle) const {
    if (kind_ == BackendKind::OpenAI) {
        return std::make_shared<ChatSession>(std::move(id), std::move(handle), config_.openai,
                                             config_.session, config_.circuit_breaker);
    }
    return std::make_shared<GenerateSession>(std::move(id), std::move(handle), config_.gemini, config_.session);
}

std::shared_ptr<Session> ConnectionPool::get_session(const std::optional<std::string>& id) {
    if (!initialized_) {
        throw ClientError("Connection pool is not initialized");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (id) {
        auto it = sessions_.find(*id);
        if (it != sessions_.end()) {
            if (!it->second->is_expired(config_.session.max_idle)) {
                // Touched under the pool lock; the sweeper must not evict it before the caller's send().
                it->second->touch();
                return it->second;
            }
            Logger::instance().info("Session " + *id + " expired, replacing it");
            ++stats_.sessions_expired;
            release_locked(*id);
        }
    }

    BackendHandle handle;
    if (!available_.empty()) {
        handle.backend = std::move(available_.front());
        available_.pop_front();
    } else {
        handle.backend = create_handle();
        handle.temporary = true;
        ++stats_.overflow_handles;
        Logger::instance().warn("Connection pool exhausted, created temporary handle");
    }

    std::string session_id = id ? *id : next_session_id();
    std::shared_ptr<Session> session;
    try {
        session = make_session(session_id, handle);
    } catch (const std::exception&) {
        if (!handle.temporary) {
            available_.push_front(std::move(handle.backend));
        }
        throw;
    }

    sessions_.emplace(session_id, session);
    ++stats_.sessions_created;
    return session;
}

void ConnectionPool::release_locked(const std::string& id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return;
    }

    const BackendHandle& handle = it->second->handle();
    if (handle.temporary || available_.size() >= config_.max_connections) {
        ++stats_.handles_discarded;
    } else {
        available_.push_back(handle.backend);
    }

    sessions_.erase(it);
    ++stats_.sessions_released;
}

void ConnectionPool::release_session(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    release_locked(id);
}

size_t ConnectionPool::sweep_expired() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> expired;
    for (const auto& [id, session] : sessions_) {
        if (session->is_expired(config_.session.max_idle)) {
            expired.push_back(id);
        }
    }

    for (const auto& id : expired) {
        release_locked(id);
        ++stats_.sessions_expired;
    }

    if (!expired.empty()) {
        Logger::instance().info("Evicted " + std::to_string(expired.size()) + " idle sessions");
    }
    return expired.size();
}

void ConnectionPool::sweep_loop() {
    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (!stopping_) {
        sweep_cv_.wait_for(lock, config_.sweep_interval, [this] { return stopping_; });
        if (stopping_) {
            break;
        }

        lock.unlock();
        try {
            sweep_expired();
        } catch (const std::exception& e) {
            Logger::instance().log_error(std::string("Session sweep failed: ") + e.what());
        }
        lock.lock();
    }
}

void ConnectionPool::shutdown() {
    std::lock_guard<std::mutex> init_lock(init_mutex_);

    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        stopping_ = true;
    }
    sweep_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        Logger::instance().info("Connection pool shut down (" + std::to_string(sessions_.size()) +
                                " sessions dropped)");
    }
    sessions_.clear();
    available_.clear();
    initialized_ = false;
}

PoolStats ConnectionPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolStats out = stats_;
    out.available = available_.size();
    out.active_sessions = sessions_.size();
    return out;
}

size_t ConnectionPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_.size();
}

std::vector<std::string> ConnectionPool::active_session_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

BackendKind ConnectionPool::backend_kind() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return kind_;
}

} // namespace scriptor
