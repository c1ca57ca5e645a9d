#include <scriptor/client.h>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/ssl.hpp>
#include <openssl/err.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace scriptor {

    ParsedUrl parse_url(const std::string& url) {
        ParsedUrl res;
        std::string s = url;

        if (s.substr(0, 8) == "https://") {
            res.is_ssl = true;
            res.port = "443";
            s.erase(0, 8);
        } else if (s.substr(0, 7) == "http://") {
            res.is_ssl = false;
            res.port = "80";
            s.erase(0, 7);
        } else {
            res.is_ssl = false;
            res.port = "80";
        }

        size_t path_pos = s.find_first_of("/?");
        if (path_pos == std::string::npos) {
            res.host = s;
            res.target = "/";
        } else {
            res.host = s.substr(0, path_pos);
            res.target = s.substr(path_pos);
            if (res.target.front() == '?') {
                res.target.insert(0, "/");
            }
        }

        size_t port_pos = res.host.find(':');
        if (port_pos != std::string::npos) {
            res.port = res.host.substr(port_pos + 1);
            res.host = res.host.substr(0, port_pos);
        }

        return res;
    }

    std::string resolve_url(const std::string& base, const std::string& relative) {
        if (relative.substr(0, 7) == "http://" || relative.substr(0, 8) == "https://") {
            return relative;
        }
        auto b = parse_url(base);
        std::string proto = b.is_ssl ? "https://" : "http://";
        std::string port_str = (b.port == "80" || b.port == "443") ? "" : ":" + b.port;

        if (!relative.empty() && relative[0] == '/') {
            return proto + b.host + port_str + relative;
        }

        size_t last_slash = base.find_last_of('/');
        if (last_slash == std::string::npos || last_slash < 8) { // http://...
             return base + "/" + relative;
        }
        return base.substr(0, last_slash + 1) + relative;
    }

    std::string join_url(std::string base, std::string_view path) {
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        if (!path.empty() && path.front() != '/') {
            base += '/';
        }
        base += path;
        return base;
    }

    std::string url_encode(std::string_view text) {
        std::ostringstream out;
        out << std::hex << std::uppercase;
        for (unsigned char c : text) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                out << static_cast<char>(c);
            } else {
                out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
            }
        }
        return out.str();
    }

    std::string form_encode(const std::map<std::string, std::string>& fields) {
        std::string body;
        for (const auto& [key, value] : fields) {
            if (!body.empty()) body += '&';
            body += url_encode(key);
            body += '=';
            body += url_encode(value);
        }
        return body;
    }

    // One TLS context for every request in the process
    static ssl::context& get_client_ssl_ctx() {
        static ssl::context ctx = [] {
            ssl::context c{ssl::context::tlsv12_client};
            c.set_default_verify_paths();
            c.set_verify_mode(ssl::verify_peer);
            return c;
        }();
        return ctx;
    }

    boost::asio::awaitable<FetchResponse> fetch(
        std::string url,
        std::string method_str,
        Headers headers,
        std::string body,
        std::chrono::milliseconds timeout
    ) {
        std::string current_url = std::move(url);
        std::string current_method = std::move(method_str);
        std::string current_body = std::move(body);
        int redirects = 0;

        while (redirects < 10) {
            auto parsed = parse_url(current_url);
            auto executor = co_await net::this_coro::executor;
            tcp::resolver resolver(executor);

            auto const results = co_await resolver.async_resolve(parsed.host, parsed.port, net::use_awaitable);

            http::request<http::string_body> req;
            req.method(http::string_to_verb(current_method));
            req.target(parsed.target);
            req.version(11);
            req.set(http::field::host, parsed.host);
            req.set(http::field::user_agent, "Scriptor/1.0");

            for (auto const& [k, v] : headers) {
                req.set(k, v);
            }

            if (!current_body.empty()) {
                req.body() = current_body;
                req.prepare_payload();
            }

            beast::flat_buffer b;
            http::response<http::string_body> res_msg;

            if (parsed.is_ssl) {
                beast::ssl_stream<beast::tcp_stream> stream(executor, get_client_ssl_ctx());
                beast::get_lowest_layer(stream).expires_after(timeout);

                if(! SSL_set_tlsext_host_name(stream.native_handle(), parsed.host.c_str()))
                    throw boost::system::system_error(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());

                co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
                co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

                co_await http::async_write(stream, req, net::use_awaitable);
                co_await http::async_read(stream, b, res_msg, net::use_awaitable);

                beast::error_code ec;
                stream.shutdown(ec);
            } else {
                beast::tcp_stream stream(executor);
                stream.expires_after(timeout);

                co_await stream.async_connect(results, net::use_awaitable);

                co_await http::async_write(stream, req, net::use_awaitable);
                co_await http::async_read(stream, b, res_msg, net::use_awaitable);

                beast::error_code ec;
                stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            }

            // Handle Redirects
            if (res_msg.result_int() >= 300 && res_msg.result_int() < 400) {
                auto it = res_msg.find(http::field::location);
                if (it != res_msg.end()) {
                    current_url = resolve_url(current_url, std::string(it->value()));
                    if (res_msg.result_int() == 303 || res_msg.result_int() == 301 || res_msg.result_int() == 302) {
                        current_method = "GET";
                        current_body = "";
                    }
                    redirects++;
                    continue;
                }
            }

            FetchResponse response;
            response.status = static_cast<int>(res_msg.result_int());
            response.body = std::move(res_msg.body());

            for (auto const& field : res_msg) {
                response.headers.insert({std::string(field.name_string()), std::string(field.value())});
            }

            co_return response;
        }
        throw std::runtime_error("Too many redirects");
    }

    boost::asio::awaitable<FetchResponse> fetch_json(
        std::string url,
        std::string method,
        Headers headers,
        boost::json::value body,
        std::chrono::milliseconds timeout
    ) {
        if (headers.find("Content-Type") == headers.end()) {
            headers["Content-Type"] = "application/json";
        }
        co_return co_await fetch(std::move(url), std::move(method), std::move(headers),
                                 boost::json::serialize(body), timeout);
    }

    FetchResponse fetch_sync(
        std::string url,
        std::string method,
        Headers headers,
        std::string body,
        std::chrono::milliseconds timeout
    ) {
        net::io_context ioc;
        auto result = net::co_spawn(
            ioc,
            fetch(std::move(url), std::move(method), std::move(headers), std::move(body), timeout),
            net::use_future);
        ioc.run();
        return result.get();
    }

    FetchResponse fetch_json_sync(
        std::string url,
        std::string method,
        Headers headers,
        const boost::json::value& body,
        std::chrono::milliseconds timeout
    ) {
        if (headers.find("Content-Type") == headers.end()) {
            headers["Content-Type"] = "application/json";
        }
        return fetch_sync(std::move(url), std::move(method), std::move(headers),
                          boost::json::serialize(body), timeout);
    }

} // namespace scriptor
