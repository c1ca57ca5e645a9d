/**
 * Example 02: Literature Search
 *
 * Runs several expert-syntax queries concurrently against the literature
 * search service and prints the reshaped records.
 * Concepts:
 * - SearchConfig::from_env (SEARCH_* variables)
 * - SearchClientPool::create fetching an OAuth token when needed
 * - dispatch_concurrent with per-query failure isolation
 */

#include <scriptor/search_client_pool.h>
#include <scriptor/environment.h>
#include <scriptor/exceptions.h>
#include <scriptor/logger.h>
#include <iostream>

using namespace scriptor;

int main(int argc, char** argv) {
    load_env();

    std::vector<SearchQuery> queries;
    for (int i = 1; i < argc; ++i) {
        queries.push_back(SearchQuery{argv[i], SearchLanguage::Chinese, "2021年12月31日"});
    }
    if (queries.empty()) {
        queries.push_back(SearchQuery{"SU=('城市热岛')", SearchLanguage::Chinese, std::nullopt});
        queries.push_back(SearchQuery{"SU=('urban heat island')", SearchLanguage::English, "2020-06"});
    }

    try {
        auto pool = SearchClientPool::create(SearchConfig::from_env());
        auto results = pool->dispatch_concurrent(queries);

        for (size_t i = 0; i < results.size(); ++i) {
            std::cout << "# " << queries[i].expression << "\n";
            if (!results[i]) {
                std::cout << "  (no result)\n";
                continue;
            }
            auto shaped = reshape_search_results(*results[i]);
            std::cout << boost::json::serialize(shaped) << "\n";
        }
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    Logger::instance().flush();
    return 0;
}
