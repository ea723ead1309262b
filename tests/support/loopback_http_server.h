#pragma once

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace clawdesk::test_support {

/**
 * Single-threaded HTTP/1.1 server on 127.0.0.1 for driving the real libcurl
 * transport. Each request head is handed to the handler, whose bytes are written
 * back verbatim, so tests control status lines, headers and framing exactly.
 */
class LoopbackHttpServer {
public:
    struct Request {
        std::string method;
        std::string target;
    };

    struct Response {
        std::string bytes;
        bool keepOpen{false}; ///< read another request on this connection (CONNECT tunnel)
        bool stall{false};    ///< hold the connection open until the server stops
    };

    using Handler = std::function<Response(const Request&)>;

    explicit LoopbackHttpServer(Handler handler)
        : handler_(std::move(handler)),
          acceptor_(io_, {boost::asio::ip::make_address("127.0.0.1"), 0}) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this] { run(); });
    }

    ~LoopbackHttpServer() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        // Wake a blocking accept()
        boost::system::error_code ec;
        boost::asio::ip::tcp::socket wake(io_);
        wake.connect(acceptor_.local_endpoint(), ec);
        thread_.join();
    }

    LoopbackHttpServer(const LoopbackHttpServer&) = delete;
    LoopbackHttpServer& operator=(const LoopbackHttpServer&) = delete;

    std::uint16_t port() const noexcept { return port_; }

    std::string url(std::string_view path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + std::string(path);
    }

    std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return requests_;
    }

    /// Complete response with Connection: close.
    static std::string response(int status, std::string_view reason, std::string_view body,
                                bool withLength = true, std::string_view extraHeaders = {}) {
        std::string out = "HTTP/1.1 " + std::to_string(status) + " " + std::string(reason) + "\r\n";
        if (withLength)
            out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
        out += extraHeaders;
        out += "Connection: close\r\n\r\n";
        out += body;
        return out;
    }

private:
    bool stopping() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return stopping_;
    }

    void run() {
        while (!stopping()) {
            boost::asio::ip::tcp::socket socket(io_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec || stopping())
                break;
            serve(socket);
        }
    }

    void serve(boost::asio::ip::tcp::socket& socket) {
        boost::asio::streambuf buf;
        for (;;) {
            boost::system::error_code ec;
            const auto n = boost::asio::read_until(socket, buf, "\r\n\r\n", ec);
            if (ec)
                return;
            const auto begin = boost::asio::buffers_begin(buf.data());
            std::string head(begin, begin + static_cast<std::ptrdiff_t>(n));
            buf.consume(n);

            Request req;
            std::istringstream line(head.substr(0, head.find("\r\n")));
            line >> req.method >> req.target;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                requests_.push_back(req);
            }

            const Response resp = handler_(req);
            boost::asio::write(socket, boost::asio::buffer(resp.bytes), ec);
            if (ec)
                return;
            if (resp.stall) {
                std::unique_lock<std::mutex> lk(mutex_);
                cv_.wait(lk, [this] { return stopping_; });
                return;
            }
            if (!resp.keepOpen) {
                socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
                return;
            }
        }
    }

    Handler handler_;
    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::uint16_t port_{0};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
    std::vector<Request> requests_;
};

} // namespace clawdesk::test_support
