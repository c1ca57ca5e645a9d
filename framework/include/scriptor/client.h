#ifndef SCRIPTOR_CLIENT_H
#define SCRIPTOR_CLIENT_H

#include <string>
#include <string_view>
#include <map>
#include <vector>
#include <chrono>
#include <algorithm>
#include <cctype>
#include <boost/json.hpp>
#include <boost/asio/awaitable.hpp>

namespace scriptor {

    struct CaseInsensitiveCompare {
        bool operator()(const std::string& a, const std::string& b) const {
            return std::lexicographical_compare(
                a.begin(), a.end(), b.begin(), b.end(),
                [](char c1, char c2) { return std::tolower(c1) < std::tolower(c2); }
            );
        }
    };

    struct FetchResponse {
        int status = 0;
        std::string body;

        std::multimap<std::string, std::string, CaseInsensitiveCompare> headers;

        bool ok() const { return status >= 200 && status < 300; }

        /**
         * @brief Parses the body as JSON.
         * @throws boost::system::system_error if the body is not valid JSON.
         */
        boost::json::value json() const { return boost::json::parse(body); }

        // Get first value
        std::string get_header(const std::string& key) const {
            auto it = headers.find(key);
            if (it != headers.end()) return it->second;
            return "";
        }

        // Get all values for a key
        std::vector<std::string> get_headers(const std::string& key) const {
            std::vector<std::string> values;
            auto range = headers.equal_range(key);
            for (auto it = range.first; it != range.second; ++it) {
                values.push_back(it->second);
            }
            return values;
        }
    };

    struct ParsedUrl {
        std::string host;
        std::string port;
        std::string target;
        bool is_ssl = false;
    };

    ParsedUrl parse_url(const std::string& url);
    std::string resolve_url(const std::string& base, const std::string& relative);

    /**
     * @brief Appends `path` to `base` with exactly one '/' between them.
     */
    std::string join_url(std::string base, std::string_view path);

    /**
     * @brief Percent-encodes everything except RFC 3986 unreserved characters.
     */
    std::string url_encode(std::string_view text);

    /**
     * @brief application/x-www-form-urlencoded body from key/value pairs.
     */
    std::string form_encode(const std::map<std::string, std::string>& fields);

    using Headers = std::map<std::string, std::string>;

    /**
     * @brief Performs an asynchronous HTTP/HTTPS request.
     *
     * Follows up to 10 redirects. The timeout bounds connect, write and read
     * together; on expiry the awaitable throws boost::system::system_error.
     *
     * @param url The full URL
     * @param method HTTP method (GET, POST, etc.)
     * @param headers Custom headers
     * @param body Raw request body (Content-Type comes from headers)
     * @param timeout Request timeout (default: 30s)
     */
    boost::asio::awaitable<FetchResponse> fetch(
        std::string url,
        std::string method = "GET",
        Headers headers = {},
        std::string body = {},
        std::chrono::milliseconds timeout = std::chrono::seconds(30)
    );

    /**
     * @brief JSON POST/PUT helper; sets Content-Type unless the caller did.
     */
    boost::asio::awaitable<FetchResponse> fetch_json(
        std::string url,
        std::string method,
        Headers headers,
        boost::json::value body,
        std::chrono::milliseconds timeout = std::chrono::seconds(30)
    );

    /**
     * @brief Blocking variant of fetch() for worker threads.
     *
     * Runs the request on a private io_context, so concurrent callers never
     * share sockets or executors.
     */
    FetchResponse fetch_sync(
        std::string url,
        std::string method = "GET",
        Headers headers = {},
        std::string body = {},
        std::chrono::milliseconds timeout = std::chrono::seconds(30)
    );

    FetchResponse fetch_json_sync(
        std::string url,
        std::string method,
        Headers headers,
        const boost::json::value& body,
        std::chrono::milliseconds timeout = std::chrono::seconds(30)
    );

} // namespace scriptor

#endif
