#include <scriptor/search_client_pool.h>
#include <scriptor/exceptions.h>
#include <scriptor/logger.h>
#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>

namespace scriptor {

SearchClientPool::SearchClientPool(std::vector<std::unique_ptr<SearchClient>> clients)
    : clients_(std::move(clients)) {
    if (clients_.empty()) {
        throw ConfigurationError("Search client pool needs at least one client");
    }
    for (auto& client : clients_) {
        idle_.push(client.get());
    }
}

std::unique_ptr<SearchClientPool> SearchClientPool::create(SearchConfig config) {
    if (config.access_token.empty() && !config.client_id.empty()) {
        auto token = fetch_access_token(config.oauth_url, config.client_id, config.client_secret, config.timeout);
        if (token) {
            if (const auto* value = token->if_contains("access_token"); value && value->is_string()) {
                config.access_token = boost::json::value_to<std::string>(*value);
            }
        }
    }
    if (config.access_token.empty()) {
        throw ConfigurationError("No search access token (set SEARCH_ACCESS_TOKEN or client credentials)");
    }

    std::vector<std::unique_ptr<SearchClient>> clients;
    const size_t count = config.max_clients ? config.max_clients : 1;
    for (size_t i = 0; i < count; ++i) {
        clients.push_back(std::make_unique<HttpSearchClient>(config));
    }

    Logger::instance().info("Search client pool ready with " + std::to_string(count) + " clients");
    return std::make_unique<SearchClientPool>(std::move(clients));
}

SearchClient* SearchClientPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !idle_.empty(); });
    SearchClient* client = idle_.front();
    idle_.pop();
    return client;
}

void SearchClientPool::release(SearchClient* client) {
    if (!client) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push(client);
    }
    cv_.notify_one();
}

size_t SearchClientPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

std::vector<std::optional<boost::json::object>>
SearchClientPool::dispatch_concurrent(const std::vector<SearchQuery>& queries) {
    std::vector<std::optional<boost::json::object>> results(queries.size());
    std::atomic<size_t> next{0};

    auto worker = [this, &queries, &results, &next] {
        for (size_t i = next++; i < queries.size(); i = next++) {
            try {
                SearchClientGuard client(*this);
                results[i] = client->search(queries[i]);
            } catch (const std::exception& e) {
                Logger::instance().log_error("Search query " + std::to_string(i) + " failed: " + e.what());
            }
        }
    };

    // More threads than clients would only wait in acquire().
    const size_t wanted = std::min(queries.size(), capacity());
    std::vector<std::thread> threads;
    threads.reserve(wanted);
    try {
        for (size_t t = 0; t < wanted; ++t) {
            threads.emplace_back(worker);
        }
    } catch (const std::system_error& e) {
        Logger::instance().warn("Search dispatch started " + std::to_string(threads.size()) + " of " +
                                std::to_string(wanted) + " threads: " + e.what());
    }

    if (threads.empty()) {
        worker();
    }
    for (auto& t : threads) {
        t.join();
    }
    return results;
}

} // namespace scriptor
