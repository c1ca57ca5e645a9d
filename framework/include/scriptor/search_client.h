#ifndef SCRIPTOR_SEARCH_CLIENT_H
#define SCRIPTOR_SEARCH_CLIENT_H

#include <boost/json.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace scriptor {

enum class SearchLanguage {
    Chinese,
    English
};

/**
 * @brief One literature query: an expert-syntax expression plus filters.
 */
struct SearchQuery {
    std::string expression;
    SearchLanguage language = SearchLanguage::Chinese;
    std::optional<std::string> date_upper;     // any format normalize_date_upper() accepts
};

struct SearchConfig {
    std::string search_url;
    std::string oauth_url;
    std::string uniplatform = "NZKPT";
    std::string access_token;
    std::string client_id;                     // used to fetch access_token when it is empty
    std::string client_secret;
    size_t max_clients = 5;
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};

    /**
     * @brief Defaults overlaid with the SEARCH_* environment variables.
     */
    static SearchConfig from_env();
};

/**
 * @brief A stateless literature-search client.
 *
 * Instances are pooled by SearchClientPool and used by one caller at a time.
 */
class SearchClient {
public:
    virtual ~SearchClient() = default;

    /**
     * @brief Runs `query` and returns the reshaped result, or nullopt on failure.
     */
    virtual std::optional<boost::json::object> search(const SearchQuery& query) = 0;
};

/**
 * @brief SearchClient over the remote HTTP search API.
 */
class HttpSearchClient : public SearchClient {
public:
    /**
     * @throws ConfigurationError if search_url is empty.
     */
    explicit HttpSearchClient(SearchConfig config);

    std::optional<boost::json::object> search(const SearchQuery& query) override;

    /**
     * @brief Request body: expert expression AND publication time <= upper bound,
     * newest first, 50 records.
     */
    static boost::json::object build_request(const SearchQuery& query);

private:
    SearchConfig config_;
};

/**
 * @brief Product codes searched for a language.
 */
std::string_view product_codes(SearchLanguage language);

/**
 * @brief Flattens a raw search response into
 * {code, message, searchResultsCollections: {total, size, items}}.
 */
boost::json::object reshape_search_results(const boost::json::object& raw);

/**
 * @brief Removes anything that looks like an HTML tag.
 */
std::string strip_html(std::string_view text);

/**
 * @brief Normalizes a date-like string to YYYYMMDD.
 *
 * Accepts 2023-05-01, 2023/5/1, 2023.05.01, 20230501, 2023年5月1日 and the
 * like; a month without a day gives the first of the month. Parenthesized
 * remarks are ignored.
 * @return std::nullopt when nothing date-like is found.
 */
std::optional<std::string> normalize_date_upper(std::string_view text);

/**
 * @brief OAuth client_credentials grant. Returns the token response or nullopt.
 */
std::optional<boost::json::object> fetch_access_token(const std::string& oauth_url,
                                                      const std::string& client_id,
                                                      const std::string& client_secret,
                                                      std::chrono::milliseconds timeout = std::chrono::seconds(30));

} // namespace scriptor

#endif
