#include <catch2/catch.hpp>
#include "http.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

using namespace mcphost;

namespace {

// What the server writes after reading the request head.
struct Script {
    std::string first;      // sent right away
    std::string later;      // sent after delay_ms
    int delay_ms = 0;
    bool hold = false;      // keep the connection open until the test finishes
};

// Accepts one connection on 127.0.0.1, records the request head and plays
// back a script.
class LoopbackServer {
public:
    explicit LoopbackServer(Script script) : script_(std::move(script)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(fd_, 1);
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this]() { serve(); });
    }

    ~LoopbackServer() {
        finish();
        ::close(fd_);
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    uint16_t port() const { return port_; }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    // Stops the server and returns the request head it received.
    std::string request_head() {
        finish();
        return head_;
    }

private:
    void finish() {
        done_.store(true);
        if (thread_.joinable()) thread_.join();
    }

    void serve() {
        struct pollfd pfd{fd_, POLLIN, 0};
        while (!done_.load()) {
            if (::poll(&pfd, 1, 100) > 0) break;
        }
        if (done_.load()) return;

        int conn = ::accept(fd_, nullptr, nullptr);
        if (conn < 0) return;
        struct timeval tv{5, 0};
        ::setsockopt(conn, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        char buf[1024];
        while (head_.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = ::recv(conn, buf, sizeof(buf), 0);
            if (n <= 0) break;
            head_.append(buf, static_cast<size_t>(n));
        }

        if (!script_.first.empty())
            ::send(conn, script_.first.data(), script_.first.size(), MSG_NOSIGNAL);
        if (!script_.later.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(script_.delay_ms));
            ::send(conn, script_.later.data(), script_.later.size(), MSG_NOSIGNAL);
        }
        while (script_.hold && !done_.load())
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ::close(conn);
    }

    Script script_;
    int fd_ = -1;
    uint16_t port_ = 0;
    std::string head_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

// ── Request head ─────────────────────────────────────────────────

TEST_CASE("http_post: Host header carries a non-default port", "[http]") {
    Script script;
    script.first = "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok";
    LoopbackServer server(script);

    auto resp = http_post(server.url("/rpc"), "{}", {{"Content-Type", "application/json"}}, 5);
    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "ok");

    std::string head = server.request_head();
    REQUIRE(head.find("POST /rpc HTTP/1.1\r\n") == 0);
    REQUIRE(head.find("\r\nHost: 127.0.0.1:" + std::to_string(server.port()) + "\r\n") !=
            std::string::npos);
}

// ── Timeouts ─────────────────────────────────────────────────────

TEST_CASE("http_post: server that never answers times out", "[http]") {
    Script script;
    script.hold = true;
    LoopbackServer server(script);

    auto start = std::chrono::steady_clock::now();
    auto resp = http_post(server.url("/rpc"), "{}", {}, 1);
    REQUIRE(seconds_since(start) < 5.0);
    REQUIRE(resp.status_code == 0);
    REQUIRE(resp.error.find("timed out") != std::string::npos);
}

TEST_CASE("http_get: body stalled after the head times out", "[http]") {
    Script script;
    script.first = "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\npartial";
    script.hold = true;
    LoopbackServer server(script);

    auto start = std::chrono::steady_clock::now();
    auto resp = http_get(server.url("/token"), {}, 1);
    REQUIRE(seconds_since(start) < 5.0);
    REQUIRE(resp.status_code == 0);
    REQUIRE(resp.error.find("timed out") != std::string::npos);
}

TEST_CASE("http_stream_get_raw: open stream outlives the request timeout", "[http]") {
    Script script;
    script.first = "HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\n\r\ndata: a\n\n";
    script.later = "data: b\n\n";
    script.delay_ms = 2500;
    LoopbackServer server(script);

    bool opened = false;
    std::string received;
    auto resp = http_stream_get_raw(
        server.url("/sse"), {},
        [&](long) { opened = true; },
        [&](const char* data, size_t len) { received.append(data, len); return true; },
        1);

    REQUIRE(opened);
    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.error.empty());
    REQUIRE(received == "data: a\n\ndata: b\n\n");
}
