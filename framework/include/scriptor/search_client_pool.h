#ifndef SCRIPTOR_SEARCH_CLIENT_POOL_H
#define SCRIPTOR_SEARCH_CLIENT_POOL_H

#include <scriptor/search_client.h>
#include <boost/json.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace scriptor {

/**
 * @brief Fixed set of interchangeable search clients.
 *
 * A client is handed to one caller at a time; acquire() blocks until one is free.
 */
class SearchClientPool {
public:
    /**
     * @throws ConfigurationError if `clients` is empty.
     */
    explicit SearchClientPool(std::vector<std::unique_ptr<SearchClient>> clients);

    SearchClientPool(const SearchClientPool&) = delete;
    SearchClientPool& operator=(const SearchClientPool&) = delete;

    /**
     * @brief max_clients HttpSearchClients sharing `config`.
     *
     * When no access token is configured but client credentials are, a token
     * is fetched first.
     * @throws ConfigurationError if no token can be obtained.
     */
    static std::unique_ptr<SearchClientPool> create(SearchConfig config);

    SearchClient* acquire();
    void release(SearchClient* client);

    /**
     * @brief Runs the queries on at most capacity() threads; result i belongs to query i.
     *
     * Returns after all queries finished. A failed query leaves std::nullopt
     * at its index and does not affect the others.
     */
    std::vector<std::optional<boost::json::object>> dispatch_concurrent(const std::vector<SearchQuery>& queries);

    size_t capacity() const { return clients_.size(); }
    size_t available() const;

private:
    std::vector<std::unique_ptr<SearchClient>> clients_;
    std::queue<SearchClient*> idle_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

// RAII Guard to ensure the client is returned to the pool
class SearchClientGuard {
    SearchClientPool& pool_;
    SearchClient* client_;
public:
    explicit SearchClientGuard(SearchClientPool& pool) : pool_(pool), client_(pool.acquire()) {}
    ~SearchClientGuard() { pool_.release(client_); }

    SearchClientGuard(const SearchClientGuard&) = delete;
    SearchClientGuard& operator=(const SearchClientGuard&) = delete;

    SearchClient* get() { return client_; }
    SearchClient* operator->() { return client_; }
};

} // namespace scriptor

#endif
