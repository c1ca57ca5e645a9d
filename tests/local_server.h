#ifndef SCRIPTOR_TESTS_LOCAL_SERVER_H
#define SCRIPTOR_TESTS_LOCAL_SERVER_H

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace scriptor::testing {

namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

using LocalRequest = http::request<http::string_body>;
using LocalResponse = http::response<http::string_body>;

inline LocalResponse make_response(http::status status, std::string body,
                                   std::string content_type = "application/json") {
    LocalResponse res{status, 11};
    res.set(http::field::content_type, content_type);
    res.body() = std::move(body);
    return res;
}

/**
 * Loopback HTTP/1.1 server on an ephemeral port. One thread per connection,
 * one request per connection.
 */
class LocalServer {
public:
    using Handler = std::function<LocalResponse(const LocalRequest&)>;

    explicit LocalServer(Handler handler)
        : handler_(std::move(handler)),
          acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
        accept_thread_ = std::thread([this] { accept_loop(); });
    }

    ~LocalServer() {
        stopping_ = true;

        // Wake the blocking accept().
        boost::system::error_code ec;
        tcp::socket poke(ioc_);
        poke.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ec);
        accept_thread_.join();

        std::vector<std::thread> workers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            workers.swap(workers_);
        }
        for (auto& t : workers) {
            if (t.joinable()) t.join();
        }
    }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

    unsigned short port() const { return port_; }

    std::string url(std::string_view path = "/") const {
        return "http://127.0.0.1:" + std::to_string(port_) + std::string(path);
    }

    std::vector<LocalRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void accept_loop() {
        while (!stopping_) {
            tcp::socket socket(ioc_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (stopping_) break;
            if (ec) continue;

            std::lock_guard<std::mutex> lock(mutex_);
            workers_.emplace_back([this, s = std::move(socket)]() mutable { serve(std::move(s)); });
        }
    }

    void serve(tcp::socket socket) {
        boost::system::error_code ec;
        boost::beast::flat_buffer buffer;
        LocalRequest req;
        http::read(socket, buffer, req, ec);
        if (ec) return;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(req);
        }

        LocalResponse res = handler_(req);
        res.keep_alive(false);
        res.prepare_payload();
        http::write(socket, res, ec);
        socket.shutdown(tcp::socket::shutdown_send, ec);
    }

    Handler handler_;
    net::io_context ioc_;
    tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    std::atomic<bool> stopping_{false};
    std::thread accept_thread_;

    mutable std::mutex mutex_;
    std::vector<std::thread> workers_;
    std::vector<LocalRequest> requests_;
};

} // namespace scriptor::testing

#endif
