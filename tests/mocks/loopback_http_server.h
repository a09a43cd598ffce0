/**
 * @file loopback_http_server.h
 * @brief Minimal HTTP/1.1 server on 127.0.0.1 for transport tests
 *
 * Accepts one connection at a time, reads the request head and a
 * Content-Length body, then either replies with a fixed status or holds the
 * connection open without replying until the peer goes away.
 */

#ifndef KCENON_STORAGE_TRANSFER_TESTS_LOOPBACK_HTTP_SERVER_H
#define KCENON_STORAGE_TRANSFER_TESTS_LOOPBACK_HTTP_SERVER_H

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace kcenon::storage_transfer::test {

/**
 * @brief What the server does once a request body has been read
 */
enum class loopback_reply {
    respond,  ///< Send the configured status and headers
    stall     ///< Never answer; wait for the client to hang up
};

/**
 * @brief One request as the server saw it
 */
struct loopback_request {
    std::string head;
    std::string body;
    uint64_t content_length = 0;
};

class loopback_http_server {
public:
    explicit loopback_http_server(loopback_reply reply = loopback_reply::respond,
                                  int status = 200,
                                  std::map<std::string, std::string> headers = {})
        : reply_(reply), status_(status), headers_(std::move(headers)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            return;
        }
        int reuse = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 4) != 0 ||
            ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            ::close(listen_fd_);
            listen_fd_ = -1;
            return;
        }
        port_ = ntohs(addr.sin_port);
        worker_ = std::thread([this] { serve(); });
    }

    ~loopback_http_server() {
        stop_ = true;
        if (worker_.joinable()) {
            worker_.join();
        }
        if (listen_fd_ >= 0) {
            ::close(listen_fd_);
        }
    }

    loopback_http_server(const loopback_http_server&) = delete;
    auto operator=(const loopback_http_server&) -> loopback_http_server& = delete;

    [[nodiscard]] auto ok() const -> bool { return listen_fd_ >= 0; }
    [[nodiscard]] auto port() const -> uint16_t { return port_; }

    [[nodiscard]] auto url(const std::string& path = "/put/object") const -> std::string {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    /**
     * @brief Wait until @p count connections have been fully handled
     */
    auto wait_for_requests(std::size_t count,
                           std::chrono::milliseconds timeout = std::chrono::seconds(5))
        -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return handled_ >= count; });
    }

    [[nodiscard]] auto last_request() const -> loopback_request {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_;
    }

private:
    static auto lowercase(std::string text) -> std::string {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    /// @return bytes read, 0 on peer close, -1 on error or stop
    auto receive(int fd, char* buffer, std::size_t size) -> long {
        while (!stop_) {
            pollfd p{fd, POLLIN, 0};
            int ready = ::poll(&p, 1, 20);
            if (ready < 0) {
                return -1;
            }
            if (ready == 0) {
                continue;
            }
            return static_cast<long>(::recv(fd, buffer, size, 0));
        }
        return -1;
    }

    void handle(int fd) {
        loopback_request request;
        std::string data;
        char buffer[16 * 1024];

        std::size_t head_end = std::string::npos;
        while (head_end == std::string::npos) {
            long n = receive(fd, buffer, sizeof(buffer));
            if (n <= 0) {
                finish(std::move(request));
                return;
            }
            data.append(buffer, static_cast<std::size_t>(n));
            head_end = data.find("\r\n\r\n");
        }
        request.head = data.substr(0, head_end + 4);
        request.body = data.substr(head_end + 4);

        auto lower = lowercase(request.head);
        auto at = lower.find("content-length:");
        if (at != std::string::npos) {
            request.content_length = std::stoull(lower.substr(at + 15));
        }

        bool peer_closed = false;
        while (request.body.size() < request.content_length) {
            long n = receive(fd, buffer, sizeof(buffer));
            if (n <= 0) {
                peer_closed = true;
                break;
            }
            request.body.append(buffer, static_cast<std::size_t>(n));
        }

        if (!peer_closed && reply_ == loopback_reply::respond) {
            std::string reply = "HTTP/1.1 " + std::to_string(status_) + " Status\r\n";
            for (const auto& [name, value] : headers_) {
                reply += name + ": " + value + "\r\n";
            }
            reply += "Content-Length: 0\r\nConnection: close\r\n\r\n";
            static_cast<void>(::send(fd, reply.data(), reply.size(), MSG_NOSIGNAL));
        } else if (!peer_closed) {
            while (receive(fd, buffer, sizeof(buffer)) > 0) {
            }
        }
        finish(std::move(request));
    }

    void finish(loopback_request request) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_ = std::move(request);
            ++handled_;
        }
        cv_.notify_all();
    }

    void serve() {
        while (!stop_) {
            pollfd p{listen_fd_, POLLIN, 0};
            if (::poll(&p, 1, 20) <= 0) {
                continue;
            }
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                continue;
            }
            handle(fd);
            ::close(fd);
        }
    }

    loopback_reply reply_;
    int status_;
    std::map<std::string, std::string> headers_;

    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread worker_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t handled_ = 0;
    loopback_request last_;
};

/**
 * @brief A loopback port with nothing listening on it
 */
inline auto closed_loopback_port() -> uint16_t {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return 1;
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t len = sizeof(addr);
    uint16_t port = 1;
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        port = ntohs(addr.sin_port);
    }
    ::close(fd);
    return port;
}

}  // namespace kcenon::storage_transfer::test

#endif  // KCENON_STORAGE_TRANSFER_TESTS_LOOPBACK_HTTP_SERVER_H
