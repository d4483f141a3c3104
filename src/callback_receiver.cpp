#include "callback_receiver.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <map>
#include <sstream>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace mcphost {

void SocketHandle::reset(int fd) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
}

// ── Redirect URI parsing ──────────────────────────────────────────────────────

bool parse_redirect_uri(const std::string& uri, RedirectTarget& out, std::string& error) {
    const std::string scheme = "http://";
    if (!starts_with(to_lower(uri), scheme)) {
        error = "redirect URI must use http://: " + uri;
        return false;
    }

    std::string rest = uri.substr(scheme.size());
    auto cut = rest.find_first_of("?#");
    if (cut != std::string::npos) rest = rest.substr(0, cut);

    auto slash = rest.find('/');
    std::string host_port = rest.substr(0, slash);
    out.path = (slash == std::string::npos) ? "/" : rest.substr(slash);

    auto colon = host_port.rfind(':');
    if (colon != std::string::npos) {
        out.host = host_port.substr(0, colon);
        std::string port_str = host_port.substr(colon + 1);
        int p = -1;
        try {
            size_t used = 0;
            p = std::stoi(port_str, &used);
            if (used != port_str.size()) p = -1;
        } catch (const std::exception&) {
            p = -1;
        }
        if (p < 0 || p > 65535) {
            error = "invalid port in redirect URI: " + uri;
            return false;
        }
        out.port = static_cast<uint16_t>(p);
    } else {
        out.host = host_port;
        out.port = 80;
    }

    if (out.host.empty()) {
        error = "missing host in redirect URI: " + uri;
        return false;
    }
    return true;
}

// ── Callback content ──────────────────────────────────────────────────────────

static std::optional<std::string> non_empty(const std::map<std::string, std::string>& q,
                                            const std::string& key) {
    auto it = q.find(key);
    if (it == q.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

AuthorizationResult authorization_result_from_query(
    const std::map<std::string, std::string>& query) {
    AuthorizationResult r;
    r.code  = non_empty(query, "code");
    r.state = non_empty(query, "state");
    r.error = non_empty(query, "error");
    return r;
}

CallbackPage render_callback_page(const AuthorizationResult& result) {
    if (result.error) {
        return {400,
                "<html><body><h1>OAuth Error</h1><p>Error: " + html_escape(*result.error) +
                "</p><p>You can close this window.</p></body></html>"};
    }
    if (result.code) {
        return {200,
                "<html><body><h1>Authorization Successful!</h1>"
                "<p>You can close this window and return to the application.</p></body></html>"};
    }
    return {400,
            "<html><body><h1>OAuth Error</h1><p>No authorization code received.</p>"
            "<p>You can close this window.</p></body></html>"};
}

// ── HTTP helpers ──────────────────────────────────────────────────────────────

namespace {

struct RequestHead {
    std::string method;
    std::string path;
    std::string query;
};

void send_http_response(int fd, int status, const std::string& content_type,
                        const std::string& body) {
    const char* reason = "OK";
    if      (status == 400) reason = "Bad Request";
    else if (status == 404) reason = "Not Found";
    else if (status == 405) reason = "Method Not Allowed";

    std::string resp =
        "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n"
        "Content-Type: " + content_type + "\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "Cache-Control: no-store\r\n"
        "Connection: close\r\n\r\n" + body;

    const char* p = resp.data();
    size_t left = resp.size();
    while (left > 0) {
        ssize_t n = ::send(fd, p, left, MSG_NOSIGNAL);
        if (n <= 0) return; // browser went away; nothing to recover
        p += n;
        left -= static_cast<size_t>(n);
    }
}

// Read until end-of-headers (CRLFCRLF), cap at 16 KB.
// Idle one-second slices an accepted connection may use before it is dropped.
constexpr int kMaxIdleSlices = 10;

// Reads in one-second slices; stop() is checked between them.
bool read_request_head(int fd, RequestHead& head, const std::function<bool()>& stop) {
    struct timeval tv{1, 0};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::string buf;
    buf.reserve(4096);
    char tmp[512];
    int idle = 0;

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            if (stop() || ++idle >= kMaxIdleSlices) return false;
            continue;
        }
        if (n <= 0) return false;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            send_http_response(fd, 400, "text/plain", "Headers too large");
            return false;
        }
    }

    auto rl_end = buf.find("\r\n");
    std::istringstream ss(buf.substr(0, rl_end));
    std::string target, version;
    if (!(ss >> head.method >> target >> version)) {
        send_http_response(fd, 400, "text/plain", "Malformed request line");
        return false;
    }

    auto q = target.find('?');
    if (q != std::string::npos) {
        head.path  = target.substr(0, q);
        head.query = target.substr(q + 1);
    } else {
        head.path = target;
    }
    return true;
}

std::string normalize_path(std::string path) {
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    return path.empty() ? "/" : path;
}

} // namespace

// ── CallbackListener ──────────────────────────────────────────────────────────

CallbackOutcome CallbackListener::listen(const std::string& redirect_uri) {
    std::string error;
    if (!arm(redirect_uri, error)) {
        CallbackOutcome out;
        out.error_kind = ErrorKind::ListenerBind;
        out.error = error;
        return out;
    }
    return wait();
}

// ── CallbackReceiver ──────────────────────────────────────────────────────────

CallbackReceiver::CallbackReceiver(Logger& log,
                                   long timeout_seconds,
                                   const std::atomic<bool>* cancel)
    : log_(log)
    , timeout_seconds_(timeout_seconds)
    , cancel_(cancel)
{}

bool CallbackReceiver::arm(const std::string& redirect_uri, std::string& error) {
    if (served_ || listener_) {
        error = "callback receiver is single-use";
        return false;
    }
    if (!parse_redirect_uri(redirect_uri, target_, error)) return false;

    std::string bind_host = (to_lower(target_.host) == "localhost") ? "127.0.0.1" : target_.host;

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(target_.port);
    if (::inet_pton(AF_INET, bind_host.c_str(), &sa.sin_addr) != 1) {
        error = "Invalid bind address: " + target_.host;
        return false;
    }

    SocketHandle sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock) {
        error = std::string("Failed to create listener socket: ") + std::strerror(errno);
        return false;
    }

    int opt = 1;
    ::setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(sock.get(), SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    if (::bind(sock.get(), reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        error = "bind " + bind_host + ":" + std::to_string(target_.port) +
                " failed: " + std::strerror(errno);
        return false;
    }
    if (::listen(sock.get(), 4) != 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
        return false;
    }

    struct sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(sock.get(), reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = target_.port;
    }

    listener_ = std::move(sock);
    log_.info("callback", "Listening for callback on " + bind_host + ":" +
                          std::to_string(bound_port_) + target_.path);
    return true;
}

CallbackOutcome CallbackReceiver::wait() {
    CallbackOutcome out;
    if (!listener_) {
        out.error_kind = ErrorKind::ListenerBind;
        out.error = served_ ? "callback receiver is single-use" : "listener is not armed";
        return out;
    }

    // Moved out so the socket closes on every return below.
    SocketHandle listener = std::move(listener_);
    served_ = true;

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::seconds(timeout_seconds_);
    const std::string want_path = normalize_path(target_.path);

    auto give_up = [&]() {
        return (cancel_ && cancel_->load()) ||
               (timeout_seconds_ > 0 && clock::now() >= deadline);
    };

    while (true) {
        if (cancel_ && cancel_->load()) {
            out.error_kind = ErrorKind::CallbackTimeout;
            out.error = "cancelled while waiting for the authorization callback";
            return out;
        }
        if (timeout_seconds_ > 0 && clock::now() >= deadline) {
            out.error_kind = ErrorKind::CallbackTimeout;
            out.error = "no authorization callback within " +
                        std::to_string(timeout_seconds_) + "s";
            return out;
        }

        struct pollfd pfd{};
        pfd.fd = listener.get();
        pfd.events = POLLIN;
        int ret = ::poll(&pfd, 1, 1000);
        if (ret < 0) {
            if (errno == EINTR) continue;
            out.error_kind = ErrorKind::ListenerBind;
            out.error = std::string("poll on listener failed: ") + std::strerror(errno);
            return out;
        }
        if (ret == 0 || !(pfd.revents & POLLIN)) continue;

        SocketHandle conn(::accept(listener.get(), nullptr, nullptr));
        if (!conn) continue;

        RequestHead head;
        if (!read_request_head(conn.get(), head, give_up)) continue;

        if (normalize_path(head.path) != want_path) {
            log_.debug("callback", "Ignoring request for " + head.path);
            send_http_response(conn.get(), 404, "text/plain", "Not Found");
            continue;
        }
        if (head.method != "GET") {
            send_http_response(conn.get(), 405, "text/plain", "Method Not Allowed");
            continue;
        }

        out.result = authorization_result_from_query(parse_query_string(head.query));
        CallbackPage page = render_callback_page(out.result);
        send_http_response(conn.get(), page.status, "text/html; charset=utf-8", page.body);
        out.ok = true;
        log_.info("callback", "Callback received (HTTP " + std::to_string(page.status) + ")");
        return out;
    }
}

} // namespace mcphost
