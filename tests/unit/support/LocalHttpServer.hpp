#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace bk::test {

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;   // lower-cased names
    std::string body;

    [[nodiscard]] std::string header(const std::string& name) const {
        const auto it = headers.find(name);
        return it == headers.end() ? std::string{} : it->second;
    }
};

struct HttpReply {
    int status = 200;
    std::string body;
    std::chrono::milliseconds delay{0};
};

// One-connection-at-a-time HTTP/1.1 responder on 127.0.0.1 with an ephemeral
// port. Every request is recorded; the handler decides the reply.
class LocalHttpServer {
public:
    using Handler = std::function<HttpReply(const HttpRequest&)>;

    explicit LocalHttpServer(Handler handler) : handler_(std::move(handler)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd_ < 0) throw std::runtime_error("socket failed");

        const int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd_, 8) != 0 ||
            ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            ::close(fd_);
            throw std::runtime_error("failed to listen on loopback");
        }
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this] { serve(); });
    }

    ~LocalHttpServer() {
        running_ = false;
        if (thread_.joinable()) thread_.join();
        ::close(fd_);
    }

    LocalHttpServer(const LocalHttpServer&) = delete;
    LocalHttpServer& operator=(const LocalHttpServer&) = delete;

    [[nodiscard]] std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    [[nodiscard]] std::vector<HttpRequest> requests() const {
        std::scoped_lock lock(mutex_);
        return requests_;
    }

private:
    Handler handler_;
    int fd_ = -1;
    unsigned short port_ = 0;
    std::atomic<bool> running_{true};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<HttpRequest> requests_;

    void serve() {
        while (running_) {
            pollfd p{fd_, POLLIN, 0};
            if (::poll(&p, 1, 50) <= 0) continue;
            const int conn = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (conn < 0) continue;
            handle(conn);
            ::close(conn);
        }
    }

    static bool readMore(const int conn, std::string& into) {
        char buf[4096];
        const ssize_t n = ::recv(conn, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        into.append(buf, static_cast<size_t>(n));
        return true;
    }

    void handle(const int conn) {
        std::string raw;
        std::size_t headerEnd;
        while ((headerEnd = raw.find("\r\n\r\n")) == std::string::npos)
            if (!readMore(conn, raw)) return;

        HttpRequest req;
        std::size_t lineEnd = raw.find("\r\n");
        const std::string requestLine = raw.substr(0, lineEnd);
        const auto sp1 = requestLine.find(' ');
        const auto sp2 = requestLine.find(' ', sp1 + 1);
        req.method = requestLine.substr(0, sp1);
        req.path = requestLine.substr(sp1 + 1, sp2 - sp1 - 1);

        while (lineEnd < headerEnd) {
            const auto next = raw.find("\r\n", lineEnd + 2);
            const std::string line = raw.substr(lineEnd + 2, next - lineEnd - 2);
            lineEnd = next;
            const auto colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name = line.substr(0, colon);
            std::transform(name.begin(), name.end(), name.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
            const auto valueStart = line.find_first_not_of(' ', colon + 1);
            req.headers[name] = valueStart == std::string::npos ? "" : line.substr(valueStart);
        }

        const auto lengthHeader = req.header("content-length");
        const std::size_t length = lengthHeader.empty() ? 0 : std::stoul(lengthHeader);
        req.body = raw.substr(headerEnd + 4);
        while (req.body.size() < length)
            if (!readMore(conn, req.body)) break;

        {
            std::scoped_lock lock(mutex_);
            requests_.push_back(req);
        }

        const HttpReply reply = handler_(req);
        if (reply.delay.count() > 0) std::this_thread::sleep_for(reply.delay);

        const std::string out = "HTTP/1.1 " + std::to_string(reply.status) + (reply.status == 200 ? " OK" : " Status") +
                                "\r\nContent-Type: application/json\r\nContent-Length: " +
                                std::to_string(reply.body.size()) + "\r\nConnection: close\r\n\r\n" + reply.body;
        std::size_t sent = 0;
        while (sent < out.size()) {
            const ssize_t n = ::send(conn, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<std::size_t>(n);
        }
    }
};

}
