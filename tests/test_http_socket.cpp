#ifdef __linux__

#include <catch2/catch_test_macros.hpp>
#include "http.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

using namespace epss;

// Plain HTTP server on 127.0.0.1 that answers one request with a fixed
// raw response and then closes the connection.
class OneShotHttpServer {
public:
    explicit OneShotHttpServer(std::string raw_response) : response_(std::move(raw_response)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) throw std::runtime_error("http server: socket failed");
        int one = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 4) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("http server: bind/listen failed");
        }
        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { serve(); });
    }

    ~OneShotHttpServer() {
        if (thread_.joinable()) thread_.join();
        ::close(listen_fd_);
    }

    OneShotHttpServer(const OneShotHttpServer&) = delete;
    OneShotHttpServer& operator=(const OneShotHttpServer&) = delete;

    uint16_t port() const { return port_; }
    std::string url(const std::string& path = "/") const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::string request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return request_;
    }

private:
    void serve() {
        pollfd pfd{listen_fd_, POLLIN, 0};
        if (::poll(&pfd, 1, 5000) <= 0) return;
        int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) return;

        std::string received;
        char buf[1024];
        while (received.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            received.append(buf, static_cast<size_t>(n));
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            request_ = received;
        }
        ::send(fd, response_.data(), response_.size(), MSG_NOSIGNAL);
        ::close(fd);
    }

    std::string response_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::string request_;
};

// ── Request ──────────────────────────────────────────────────────

TEST_CASE("http_get: sends a GET with host, headers and query", "[http]") {
    OneShotHttpServer server("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\n{}");
    auto resp = http_get(server.url("/data/v1/epss?cve=CVE-2022-27225"),
                         {{"Accept", "application/json"}}, 5);
    REQUIRE(resp.status_code == 200);

    std::string req = server.request();
    REQUIRE(req.rfind("GET /data/v1/epss?cve=CVE-2022-27225 HTTP/1.1\r\n", 0) == 0);
    REQUIRE(req.find("Host: 127.0.0.1:" + std::to_string(server.port()) + "\r\n") !=
            std::string::npos);
    REQUIRE(req.find("Accept: application/json\r\n") != std::string::npos);
    REQUIRE(req.find("Connection: close\r\n") != std::string::npos);
}

TEST_CASE("http_get: query without a path gets a leading slash", "[http]") {
    OneShotHttpServer server("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
    auto resp = http_get("http://127.0.0.1:" + std::to_string(server.port()) + "?limit=1", {}, 5);
    REQUIRE(resp.status_code == 200);
    REQUIRE(server.request().rfind("GET /?limit=1 HTTP/1.1\r\n", 0) == 0);
}

// ── Response bodies ──────────────────────────────────────────────

TEST_CASE("http_get: Content-Length body", "[http]") {
    OneShotHttpServer server(
        "HTTP/1.1 200 OK\r\ncontent-length: 11\r\nContent-Type: application/json\r\n\r\n"
        "{\"ok\":true}");
    auto resp = http_get(server.url(), {}, 5);
    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "{\"ok\":true}");
}

TEST_CASE("http_get: chunked body", "[http]") {
    OneShotHttpServer server(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "5\r\n{\"sta\r\n"
        "a;ext=1\r\ntus\":\"OK\"}\r\n"
        "0\r\n\r\n");
    auto resp = http_get(server.url(), {}, 5);
    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "{\"status\":\"OK\"}");
}

TEST_CASE("http_get: body delimited by connection close", "[http]") {
    OneShotHttpServer server("HTTP/1.0 503 Service Unavailable\r\n\r\nbusy");
    auto resp = http_get(server.url(), {}, 5);
    REQUIRE(resp.status_code == 503);
    REQUIRE(resp.body == "busy");
}

// ── Failures ─────────────────────────────────────────────────────

TEST_CASE("http_get: truncated body yields status 0", "[http]") {
    OneShotHttpServer server("HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nshort");
    auto resp = http_get(server.url(), {}, 5);
    REQUIRE(resp.status_code == 0);
    REQUIRE(resp.body.empty());
}

TEST_CASE("http_get: truncated chunk yields status 0", "[http]") {
    OneShotHttpServer server(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n10\r\nabc");
    REQUIRE(http_get(server.url(), {}, 5).status_code == 0);
}

TEST_CASE("http_get: malformed status line yields status 0", "[http]") {
    OneShotHttpServer server("SSH-2.0-OpenSSH\r\n\r\n");
    REQUIRE(http_get(server.url(), {}, 5).status_code == 0);
}

TEST_CASE("http_get: unsupported or malformed URL yields status 0", "[http]") {
    REQUIRE(http_get("ftp://127.0.0.1/file", {}, 1).status_code == 0);
    REQUIRE(http_get("not a url", {}, 1).status_code == 0);
    REQUIRE(http_get("http://", {}, 1).status_code == 0);
}

TEST_CASE("http_get: refused connection yields status 0", "[http]") {
    uint16_t dead_port = 0;
    {
        OneShotHttpServer server("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
        dead_port = server.port();
        http_get(server.url(), {}, 5);
    }
    auto resp = http_get("http://127.0.0.1:" + std::to_string(dead_port) + "/", {}, 1);
    REQUIRE(resp.status_code == 0);
}

TEST_CASE("SocketHttpClient: forwards to http_get", "[http]") {
    OneShotHttpServer server("HTTP/1.1 404 Not Found\r\nContent-Length: 9\r\n\r\nnot found");
    SocketHttpClient client;
    auto resp = client.get(server.url("/missing"), {}, 5);
    REQUIRE(resp.status_code == 404);
    REQUIRE(resp.body == "not found");
}

#endif // __linux__
