// HTTP/HTTPS GET over POSIX sockets + OpenSSL for Linux builds.
// Same interface as the libcurl client in http.cpp. http_init/cleanup are
// no-ops since OpenSSL 1.1+ initialises itself.
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>

namespace epss {

void http_init() {}
void http_cleanup() {}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static std::optional<ParsedUrl> parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") return std::nullopt;
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);
    if (host_port.empty()) return std::nullopt;

    if (path_start == std::string::npos) {
        result.path = "/";
    } else if (url[path_start] == '?') {
        result.path = "/" + url.substr(path_start);
    } else {
        result.path = url.substr(path_start);
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    return result;
}

// ── Transport ──────────────────────────────────────────────────

static void log_failure(const ParsedUrl& url, const std::string& what) {
    std::cerr << "[http] " << url.host << ":" << url.port << ": " << what << "\n";
}

// Owns a connected TCP socket.
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() { if (fd_ >= 0) ::close(fd_); }
    Socket(Socket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    Socket& operator=(Socket&& other) noexcept {
        if (this != &other) {
            if (fd_ >= 0) ::close(fd_);
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    int fd() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

// Non-blocking connect bounded by timeout_secs, tried against every
// resolved address in turn.
static Socket connect_tcp(const ParsedUrl& url, long timeout_secs, std::string& error) {
    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
    if (gai != 0) {
        error = std::string("cannot resolve host: ") + gai_strerror(gai);
        return Socket();
    }

    Socket sock;
    error = "connection failed";
    for (auto* ai = res; ai && !sock.valid(); ai = ai->ai_next) {
        Socket candidate(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!candidate.valid()) continue;

        int flags = fcntl(candidate.fd(), F_GETFL, 0);
        fcntl(candidate.fd(), F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(candidate.fd(), ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{candidate.fd(), POLLOUT, 0};
            rc = ::poll(&pfd, 1, timeout_secs > 0 ? static_cast<int>(timeout_secs * 1000) : -1);
            if (rc == 0) {
                error = "connect timed out";
                continue;
            }
            int err = 0;
            socklen_t elen = sizeof(err);
            getsockopt(candidate.fd(), SOL_SOCKET, SO_ERROR, &err, &elen);
            if (rc < 0 || err != 0) {
                error = std::strerror(rc < 0 ? errno : err);
                continue;
            }
        } else if (rc != 0) {
            error = std::strerror(errno);
            continue;
        }

        fcntl(candidate.fd(), F_SETFL, flags);
        sock = std::move(candidate);
    }
    freeaddrinfo(res);
    if (!sock.valid()) return sock;

    struct timeval tv{timeout_secs, 0};
    setsockopt(sock.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock.fd(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    return sock;
}

// TCP socket with an optional verified TLS session on top.
class Transport {
public:
    Transport() = default;
    ~Transport() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
    }
    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    bool open(const ParsedUrl& url, long timeout_secs) {
        std::string error;
        sock_ = connect_tcp(url, timeout_secs, error);
        if (!sock_.valid()) {
            log_failure(url, error);
            return false;
        }
        if (url.tls && !start_tls(url.host)) {
            log_failure(url, "TLS handshake failed");
            return false;
        }
        return true;
    }

    // >0 bytes read, 0 on EOF, -1 on error or timeout.
    ssize_t read_some(char* buf, size_t len) {
        for (;;) {
            if (ssl_) {
                int n = SSL_read(ssl_, buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl_, n);
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) continue;
                return -1;
            }
            ssize_t n = ::recv(sock_.fd(), buf, len, 0);
            if (n >= 0) return n;
            if (errno != EINTR) return -1;
        }
    }

    bool write_all(const std::string& data) {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            ssize_t n = 0;
            if (ssl_) {
                int w = SSL_write(ssl_, p, static_cast<int>(left));
                if (w <= 0) {
                    int err = SSL_get_error(ssl_, w);
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) continue;
                    return false;
                }
                n = w;
            } else {
                n = ::send(sock_.fd(), p, left, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    bool start_tls(const std::string& host) {
        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return false;
        SSL_set_fd(ssl_, sock_.fd());
        SSL_set_tlsext_host_name(ssl_, host.c_str());
        SSL_set1_host(ssl_, host.c_str());
        return SSL_connect(ssl_) == 1;
    }

    Socket sock_;
    SSL_CTX* ctx_ = nullptr;
    SSL* ssl_ = nullptr;
};

// ── Request building ───────────────────────────────────────────

// Host carries the port only when it differs from the scheme default.
static std::string build_request(const ParsedUrl& url, const std::vector<Header>& headers) {
    bool default_port = url.port == (url.tls ? "443" : "80");
    std::string req = "GET " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + (default_port ? url.host : url.host + ":" + url.port) + "\r\n";
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    req += "Connection: close\r\n\r\n";
    return req;
}

// ── Response parsing ───────────────────────────────────────────

struct ResponseHead {
    long status = 0;
    bool chunked = false;
    std::optional<size_t> content_length;
};

// Buffered reader over a connection. Bytes read past the current
// request are kept in pending_ for the next call.
class ResponseReader {
public:
    explicit ResponseReader(Transport& conn) : conn_(conn) {}

    // One line without its CRLF; nullopt on EOF or error.
    std::optional<std::string> line() {
        for (;;) {
            size_t nl = pending_.find('\n');
            if (nl != std::string::npos) {
                std::string out = pending_.substr(0, nl);
                pending_.erase(0, nl + 1);
                if (!out.empty() && out.back() == '\r') out.pop_back();
                return out;
            }
            if (!fill()) return std::nullopt;
        }
    }

    bool exactly(size_t n, std::string& out) {
        while (pending_.size() < n) {
            if (!fill()) return false;
        }
        out.append(pending_, 0, n);
        pending_.erase(0, n);
        return true;
    }

    void rest(std::string& out) {
        while (fill()) {}
        out += pending_;
        pending_.clear();
    }

    // Status line and headers. nullopt when the head is malformed.
    std::optional<ResponseHead> head() {
        auto status_line = line();
        if (!status_line) return std::nullopt;

        // "HTTP/1.1 200 OK"
        size_t sp = status_line->find(' ');
        if (sp == std::string::npos || status_line->size() < sp + 4) return std::nullopt;
        std::string code = status_line->substr(sp + 1, 3);
        char* end = nullptr;
        ResponseHead h;
        h.status = std::strtol(code.c_str(), &end, 10);
        if (end != code.c_str() + code.size() || h.status < 100) return std::nullopt;

        for (;;) {
            auto header = line();
            if (!header) return std::nullopt;
            if (header->empty()) break;

            size_t colon = header->find(':');
            if (colon == std::string::npos) continue;
            std::string name = lower(header->substr(0, colon));
            std::string value = lower(header->substr(colon + 1));
            value.erase(0, value.find_first_not_of(" \t"));

            if (name == "transfer-encoding") {
                h.chunked = value.find("chunked") != std::string::npos;
            } else if (name == "content-length") {
                char* cl_end = nullptr;
                unsigned long long n = std::strtoull(value.c_str(), &cl_end, 10);
                if (cl_end == value.c_str() || value[0] == '-') return std::nullopt;
                h.content_length = static_cast<size_t>(n);
            }
        }
        return h;
    }

    // Chunked, sized or read-to-close body. false when truncated.
    bool body(const ResponseHead& h, std::string& out) {
        if (h.chunked) {
            for (;;) {
                auto size_line = line();
                if (!size_line) return false;
                // hex size, optional ";ext"
                char* size_end = nullptr;
                size_t size = std::strtoul(size_line->c_str(), &size_end, 16);
                if (size_end == size_line->c_str()) return false;
                if (size == 0) return true;
                std::string crlf;
                if (!exactly(size, out) || !exactly(2, crlf)) return false;
            }
        }
        if (h.content_length) return exactly(*h.content_length, out);
        rest(out);
        return true;
    }

private:
    bool fill() {
        char buf[4096];
        ssize_t n = conn_.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        pending_.append(buf, static_cast<size_t>(n));
        return true;
    }

    static std::string lower(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    Transport& conn_;
    std::string pending_;
};

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::get(const std::string& url,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return http_get(url, headers, timeout_seconds);
}

HttpResponse http_get(const std::string& url_str,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    auto url = parse_url(url_str);
    if (!url) {
        std::cerr << "[http] Unsupported URL: " << url_str << "\n";
        return {};
    }

    Transport conn;
    if (!conn.open(*url, timeout_seconds)) return {};
    if (!conn.write_all(build_request(*url, headers))) {
        log_failure(*url, "failed to send request");
        return {};
    }

    ResponseReader reader(conn);
    auto head = reader.head();
    if (!head) {
        log_failure(*url, "malformed or missing response head");
        return {};
    }

    HttpResponse resp;
    if (!reader.body(*head, resp.body)) {
        log_failure(*url, "response body truncated");
        return {};
    }
    resp.status_code = head->status;
    return resp;
}

} // namespace epss

#endif // __linux__
