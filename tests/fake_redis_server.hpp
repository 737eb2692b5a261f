#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace epss {

// Minimal in-process RESP2 server for tests. Listens on 127.0.0.1 with an
// ephemeral port and understands the commands the Redis backend sends.
// SCAN pages through a snapshot of the keyspace taken at cursor 0.
class FakeRedisServer {
public:
    explicit FakeRedisServer(std::string password = "") : password_(std::move(password)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) throw std::runtime_error("fake redis: socket failed");
        int one = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 16) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("fake redis: bind/listen failed");
        }
        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { loop(); });
    }

    ~FakeRedisServer() {
        stop_.store(true);
        if (thread_.joinable()) thread_.join();
        for (auto& c : clients_) ::close(c.fd);
        ::close(listen_fd_);
    }

    FakeRedisServer(const FakeRedisServer&) = delete;
    FakeRedisServer& operator=(const FakeRedisServer&) = delete;

    uint16_t port() const { return port_; }

    // Seed or inspect the keyspace directly.
    void put(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        store_[key] = value;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return store_.count(key) > 0;
    }

    std::string value(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = store_.find(key);
        return it == store_.end() ? "" : it->second;
    }

    // Keys examined per SCAN call; 0 honours the client's COUNT.
    void set_scan_page_size(size_t n) {
        std::lock_guard<std::mutex> lock(mutex_);
        scan_page_ = n;
    }

    // Expiry in seconds given for `key` (SETEX, SET EX or SET PX); 0 when none.
    int64_t ttl(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = ttls_.find(key);
        return it == ttls_.end() ? 0 : it->second;
    }

    uint32_t selected_db() const { return selected_db_.load(); }

    std::vector<std::vector<std::string>> commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

    // Drop every open client socket (simulates a server restart).
    void disconnect_clients() { drop_clients_.store(true); }

private:
    struct Client {
        int fd;
        std::string buffer;
        bool authed;
    };

    void loop() {
        while (!stop_.load()) {
            if (drop_clients_.exchange(false)) {
                for (auto& c : clients_) ::close(c.fd);
                clients_.clear();
            }

            std::vector<pollfd> fds;
            fds.push_back({listen_fd_, POLLIN, 0});
            for (const auto& c : clients_) fds.push_back({c.fd, POLLIN, 0});

            if (::poll(fds.data(), fds.size(), 20) <= 0) continue;

            if (fds[0].revents & POLLIN) {
                int fd = ::accept(listen_fd_, nullptr, nullptr);
                if (fd >= 0) clients_.push_back({fd, "", password_.empty()});
            }

            for (size_t i = 1; i < fds.size(); ++i) {
                if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                Client& c = clients_[i - 1];
                char buf[4096];
                ssize_t n = ::recv(c.fd, buf, sizeof(buf), 0);
                if (n <= 0) {
                    ::close(c.fd);
                    c.fd = -1;
                    continue;
                }
                c.buffer.append(buf, static_cast<size_t>(n));
                serve(c);
            }

            std::vector<Client> alive;
            for (auto& c : clients_) {
                if (c.fd >= 0) alive.push_back(std::move(c));
            }
            clients_ = std::move(alive);
        }
    }

    void serve(Client& c) {
        for (;;) {
            std::vector<std::string> args;
            switch (parse_command(c.buffer, args)) {
                case Parse::Incomplete: return;
                case Parse::Malformed:
                    c.buffer.clear();
                    return;
                case Parse::Complete: break;
            }
            std::string reply = handle(c, args);
            ::send(c.fd, reply.data(), reply.size(), MSG_NOSIGNAL);
        }
    }

    enum class Parse { Complete, Incomplete, Malformed };

    // Read a CRLF line starting at pos.
    static bool read_line(const std::string& buf, size_t& pos, std::string& line) {
        size_t end = buf.find("\r\n", pos);
        if (end == std::string::npos) return false;
        line = buf.substr(pos, end - pos);
        pos = end + 2;
        return true;
    }

    static bool to_count(const std::string& s, long long& out) {
        try {
            size_t used = 0;
            out = std::stoll(s, &used);
            return used == s.size();
        } catch (const std::logic_error&) {
            return false;
        }
    }

    // Commands arrive as an array of bulk strings. Consumes the command from
    // `buf` only when it is complete.
    static Parse parse_command(std::string& buf, std::vector<std::string>& args) {
        if (buf.empty()) return Parse::Incomplete;
        if (buf[0] != '*') return Parse::Malformed;

        size_t pos = 1;
        std::string line;
        long long count = 0;
        if (!read_line(buf, pos, line)) return Parse::Incomplete;
        if (!to_count(line, count) || count < 0) return Parse::Malformed;

        for (long long i = 0; i < count; ++i) {
            if (pos >= buf.size()) return Parse::Incomplete;
            if (buf[pos] != '$') return Parse::Malformed;
            ++pos;
            long long len = 0;
            if (!read_line(buf, pos, line)) return Parse::Incomplete;
            if (!to_count(line, len) || len < 0) return Parse::Malformed;
            auto n = static_cast<size_t>(len);
            if (buf.size() < pos + n + 2) return Parse::Incomplete;
            args.push_back(buf.substr(pos, n));
            pos += n + 2;
        }
        buf.erase(0, pos);
        return Parse::Complete;
    }

    static std::string simple(const std::string& s) { return "+" + s + "\r\n"; }
    static std::string error(const std::string& s) { return "-" + s + "\r\n"; }
    static std::string integer(int64_t v) { return ":" + std::to_string(v) + "\r\n"; }
    static std::string nil() { return "$-1\r\n"; }
    static std::string bulk(const std::string& s) {
        return "$" + std::to_string(s.size()) + "\r\n" + s + "\r\n";
    }

    // Glob with '*', '?' and backslash escapes.
    static bool glob_match(const char* p, const char* s) {
        for (; *p; ++p) {
            if (*p == '*') {
                for (const char* t = s;; ++t) {
                    if (glob_match(p + 1, t)) return true;
                    if (!*t) return false;
                }
            }
            if (!*s) return false;
            if (*p == '?') { ++s; continue; }
            if (*p == '\\' && p[1]) ++p;
            if (*p != *s) return false;
            ++s;
        }
        return *s == '\0';
    }

    std::string handle(Client& c, const std::vector<std::string>& args) {
        if (args.empty()) return error("ERR empty command");
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.push_back(args);
        const std::string& cmd = args[0];

        if (cmd == "AUTH") {
            const std::string& given = args.back();
            if (args.size() >= 2 && given == password_) {
                c.authed = true;
                return simple("OK");
            }
            return error("WRONGPASS invalid username-password pair or user is disabled.");
        }
        if (!c.authed) return error("NOAUTH Authentication required.");

        if (cmd == "PING") return simple("PONG");
        if (cmd == "SELECT" && args.size() == 2) {
            selected_db_.store(static_cast<uint32_t>(std::stoul(args[1])));
            return simple("OK");
        }
        if (cmd == "GET" && args.size() == 2) {
            auto it = store_.find(args[1]);
            if (it == store_.end()) return nil();
            return bulk(it->second);
        }
        if (cmd == "SET" && args.size() >= 3) {
            store_[args[1]] = args[2];
            ttls_.erase(args[1]);
            if (args.size() == 5 && args[3] == "EX") ttls_[args[1]] = std::stoll(args[4]);
            if (args.size() == 5 && args[3] == "PX") ttls_[args[1]] = std::stoll(args[4]) / 1000;
            return simple("OK");
        }
        if (cmd == "SETEX" && args.size() == 4) {
            store_[args[1]] = args[3];
            ttls_[args[1]] = std::stoll(args[2]);
            return simple("OK");
        }
        if (cmd == "DEL") {
            int64_t removed = 0;
            for (size_t i = 1; i < args.size(); ++i) {
                removed += static_cast<int64_t>(store_.erase(args[i]));
                ttls_.erase(args[i]);
            }
            return integer(removed);
        }
        if (cmd == "EXISTS" && args.size() == 2) {
            return integer(static_cast<int64_t>(store_.count(args[1])));
        }
        if (cmd == "SCAN" && args.size() >= 2) {
            return scan(args);
        }
        return error("ERR unknown command '" + cmd + "'");
    }

    std::string scan(const std::vector<std::string>& args) {
        long long cursor = 0;
        if (!to_count(args[1], cursor) || cursor < 0) return error("ERR invalid cursor");

        std::string pattern = "*";
        long long count = 10;
        for (size_t i = 2; i + 1 < args.size(); i += 2) {
            if (args[i] == "MATCH") pattern = args[i + 1];
            if (args[i] == "COUNT" && !to_count(args[i + 1], count)) return error("ERR syntax error");
        }
        size_t page = scan_page_ > 0 ? scan_page_ : static_cast<size_t>(std::max(1LL, count));

        if (cursor == 0) {
            scan_snapshot_.clear();
            for (const auto& kv : store_) scan_snapshot_.push_back(kv.first);
        }
        auto from = std::min(static_cast<size_t>(cursor), scan_snapshot_.size());
        auto to = std::min(from + page, scan_snapshot_.size());

        std::vector<std::string> keys;
        for (size_t i = from; i < to; ++i) {
            const std::string& key = scan_snapshot_[i];
            if (store_.count(key) && glob_match(pattern.c_str(), key.c_str())) keys.push_back(key);
        }

        std::string next = to >= scan_snapshot_.size() ? "0" : std::to_string(to);
        std::string out = "*2\r\n" + bulk(next) + "*" + std::to_string(keys.size()) + "\r\n";
        for (const auto& k : keys) out += bulk(k);
        return out;
    }

    std::string password_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> drop_clients_{false};
    std::atomic<uint32_t> selected_db_{0};

    std::vector<Client> clients_; // owned by the server thread

    mutable std::mutex mutex_;
    std::map<std::string, std::string> store_;
    std::map<std::string, int64_t> ttls_;
    std::vector<std::vector<std::string>> commands_;
    std::vector<std::string> scan_snapshot_;
    size_t scan_page_ = 0;
};

} // namespace epss
