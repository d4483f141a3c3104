// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl) with identical
// interface behaviour: http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <cerrno>
#include <string>
#include <stdexcept>

namespace mcphost {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
        throw std::runtime_error("unsupported scheme: " + scheme);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::runtime_error("missing host in URL: " + url);
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

enum class ReadStatus { Data, Eof, Error, Aborted, TimedOut };

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    bool     aborted = false;
    bool     timed_out = false;

    // Zero means no deadline; reads then wait only on the abort flag.
    std::chrono::steady_clock::time_point deadline{};

    Connection() = default;
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs, std::string& error) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0) {
            error = std::string("cannot resolve ") + url.host + ": " + gai_strerror(gai);
            return false;
        }

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect so we can honour timeout_secs.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{timeout_secs, 0};
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    }
                }
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) {
            error = "cannot connect to " + url.host + ":" + url.port;
            return false;
        }

        // Use full timeout for TLS handshake, then switch to 1-second slices
        // so abort-flag checks work during body streaming.
        if (url.tls) {
            set_socket_timeout(timeout_secs);

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) { error = "SSL_CTX_new failed"; return false; }
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) { error = "SSL_new failed"; return false; }
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) {
                char buf[256];
                ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
                error = std::string("TLS handshake with ") + url.host + " failed: " + buf;
                return false;
            }
        }

        // 1-second slice timeout for body I/O (enables abort-flag polling).
        set_socket_timeout(1);
        return true;
    }

    bool past_deadline() const {
        return deadline != std::chrono::steady_clock::time_point{} &&
               std::chrono::steady_clock::now() >= deadline;
    }

    // Read some bytes. EAGAIN (1-second slice expiry) loops back so the
    // abort flag and the deadline are checked between slices.
    ReadStatus read_some(char* buf, size_t len, size_t& got) {
        got = 0;
        while (true) {
            if (g_socket_abort_flag &&
                g_socket_abort_flag->load(std::memory_order_relaxed)) {
                aborted = true;
                return ReadStatus::Aborted;
            }
            if (past_deadline()) {
                timed_out = true;
                return ReadStatus::TimedOut;
            }

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) { got = static_cast<size_t>(n); return ReadStatus::Data; }
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) return ReadStatus::Eof;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK)
                        continue; // 1-second slice expired
                    if (n == 0) return ReadStatus::Eof; // peer closed without close_notify
                }
                return ReadStatus::Error;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) { got = static_cast<size_t>(n); return ReadStatus::Data; }
                if (n == 0) return ReadStatus::Eof;
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                return ReadStatus::Error;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (past_deadline()) {
                timed_out = true;
                return false;
            }
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                  const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host;
    if (url.port != (url.tls ? "443" : "80")) req += ":" + url.port;
    req += "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (method == "POST" && !has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false if the connection ends before a full line arrives.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        size_t got = 0;
        if (conn.read_some(buf, sizeof(buf), got) != ReadStatus::Data) return false;
        leftover.append(buf, got);
    }
}

struct ResponseHead {
    long status = 0;
    bool is_chunked = false;
    bool has_length = false;
    size_t content_length = 0;
};

// Parse status line + headers.
static bool parse_response_head(Connection& conn, std::string& leftover, ResponseHead& head) {
    std::string status_line;
    if (!read_line(conn, leftover, status_line)) return false;

    // "HTTP/1.1 200 OK" — extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) return false;
    try { head.status = std::stol(status_line.substr(sp1 + 1, 3)); }
    catch (const std::exception&) { return false; }

    while (true) {
        std::string line;
        if (!read_line(conn, leftover, line)) return false;
        if (line.empty()) break; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        for (auto& c : name)  c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

        if (name == "transfer-encoding") {
            head.is_chunked = (value.find("chunked") != std::string::npos);
        } else if (name == "content-length") {
            try {
                head.content_length = std::stoul(value);
                head.has_length = true;
            } catch (const std::exception&) {
                head.has_length = false;
            }
        }
    }
    return true;
}

enum class BodyEnd { Complete, Stopped, ReadError, Aborted, TimedOut };

static BodyEnd end_from(const Connection& conn, ReadStatus st) {
    if (st == ReadStatus::Aborted || conn.aborted) return BodyEnd::Aborted;
    if (st == ReadStatus::TimedOut || conn.timed_out) return BodyEnd::TimedOut;
    if (st == ReadStatus::Error) return BodyEnd::ReadError;
    return BodyEnd::Complete;
}

// Deliver exactly n bytes to sink, consuming leftover first.
template <typename Sink>
static BodyEnd pump_exactly(Connection& conn, std::string& leftover, size_t n, Sink& sink) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            if (!sink(leftover.data(), take)) return BodyEnd::Stopped;
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        size_t got = 0;
        ReadStatus st = conn.read_some(buf, std::min(n, sizeof(buf)), got);
        if (st == ReadStatus::Eof) return BodyEnd::ReadError; // truncated
        if (st != ReadStatus::Data) return end_from(conn, st);
        if (!sink(buf, got)) return BodyEnd::Stopped;
        n -= got;
    }
    return BodyEnd::Complete;
}

// Deliver everything until the peer closes the connection.
template <typename Sink>
static BodyEnd pump_until_eof(Connection& conn, std::string& leftover, Sink& sink) {
    if (!leftover.empty()) {
        if (!sink(leftover.data(), leftover.size())) return BodyEnd::Stopped;
        leftover.clear();
    }
    char buf[4096];
    for (;;) {
        size_t got = 0;
        ReadStatus st = conn.read_some(buf, sizeof(buf), got);
        if (st != ReadStatus::Data) return end_from(conn, st);
        if (!sink(buf, got)) return BodyEnd::Stopped;
    }
}

// Decode the body (chunked, content-length or read-to-close) into sink.
template <typename Sink>
static BodyEnd pump_body(Connection& conn, std::string& leftover,
                          const ResponseHead& head, Sink& sink) {
    if (head.is_chunked) {
        for (;;) {
            std::string size_line;
            if (!read_line(conn, leftover, size_line))
                return end_from(conn, ReadStatus::Error);
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) return BodyEnd::Complete;
            BodyEnd end = pump_exactly(conn, leftover, chunk_size, sink);
            if (end != BodyEnd::Complete) return end;
            std::string crlf;
            if (!read_line(conn, leftover, crlf)) // trailing \r\n
                return end_from(conn, ReadStatus::Error);
        }
    }
    if (head.has_length) {
        return pump_exactly(conn, leftover, head.content_length, sink);
    }
    return pump_until_eof(conn, leftover, sink);
}

static const char* body_end_error(BodyEnd end) {
    switch (end) {
        case BodyEnd::ReadError: return "connection lost while reading response body";
        case BodyEnd::Aborted:   return "aborted";
        case BodyEnd::TimedOut:  return "timed out waiting for response";
        default:                 return "";
    }
}

// ── Core request executor ──────────────────────────────────────

static HttpResponse do_request(const std::string& method,
                                const std::string& url_str,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                long timeout_secs,
                                const StreamOpenCallback* on_open,
                                RawChunkCallback* on_chunk) {
    HttpResponse resp;

    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::exception& e) {
        resp.error = e.what();
        return resp;
    }

    Connection conn;
    if (timeout_secs > 0)
        conn.deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);
    if (!conn.connect(url, timeout_secs, resp.error)) return resp;

    std::string request = build_request(method, url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) {
        resp.error = conn.timed_out ? "timed out sending request to " + url.host
                                    : "failed to send request to " + url.host;
        return resp;
    }

    std::string leftover;
    ResponseHead head;
    if (!parse_response_head(conn, leftover, head)) {
        if (conn.aborted) resp.error = "aborted";
        else if (conn.timed_out) resp.error = "timed out waiting for response from " + url.host;
        else resp.error = "malformed or missing response from " + url.host;
        return resp;
    }

    // A successful stream is unbounded: the deadline only covered the head.
    bool streaming = on_chunk && is_success(head.status);
    if (streaming) conn.deadline = {};

    BodyEnd end;
    if (streaming) {
        if (on_open && *on_open) (*on_open)(head.status);
        auto sink = [on_chunk](const char* data, size_t len) { return (*on_chunk)(data, len); };
        end = pump_body(conn, leftover, head, sink);
    } else {
        auto sink = [&resp](const char* data, size_t len) {
            resp.body.append(data, len);
            return true;
        };
        end = pump_body(conn, leftover, head, sink);
    }
    resp.error = body_end_error(end);
    // A buffered body cut off by the deadline is not a usable response.
    if (end == BodyEnd::TimedOut && !streaming) {
        resp.status_code = 0;
    } else {
        resp.status_code = head.status;
    }
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse SocketHttpClient::get(const std::string& url,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return http_get(url, headers, timeout_seconds);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    return do_request("POST", url, body, headers, timeout_seconds, nullptr, nullptr);
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    return do_request("GET", url, "", headers, timeout_seconds, nullptr, nullptr);
}

// Default base-class implementation delegates to http_stream_get_raw.
HttpResponse HttpClient::stream_get_raw(const std::string& url,
                                         const std::vector<Header>& headers,
                                         StreamOpenCallback on_open,
                                         RawChunkCallback on_chunk,
                                         long timeout_seconds) {
    return http_stream_get_raw(url, headers, std::move(on_open), std::move(on_chunk),
                               timeout_seconds);
}

HttpResponse http_stream_get_raw(const std::string& url,
                                 const std::vector<Header>& headers,
                                 StreamOpenCallback on_open,
                                 RawChunkCallback on_chunk,
                                 long timeout_seconds) {
    return do_request("GET", url, "", headers, timeout_seconds, &on_open, &on_chunk);
}

} // namespace mcphost

#endif // __linux__
