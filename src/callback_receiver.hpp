#pragma once
#include "errors.hpp"
#include "logger.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace mcphost {

// Query parameters captured from the one redirect request.
// Empty values are treated as absent.
struct AuthorizationResult {
    std::optional<std::string> code;
    std::optional<std::string> state;
    std::optional<std::string> error;
};

struct CallbackOutcome {
    bool ok = false;
    AuthorizationResult result;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
};

// Where to listen, derived from the redirect URI.
struct RedirectTarget {
    std::string host;     // bind address ("localhost" maps to 127.0.0.1)
    uint16_t port = 80;   // 0 = ephemeral, see CallbackReceiver::bound_port()
    std::string path = "/";
};

// Accepts "http://host[:port][/path]". Returns false with a reason otherwise.
bool parse_redirect_uri(const std::string& uri, RedirectTarget& out, std::string& error);

// Extract code/state/error from a decoded query map.
AuthorizationResult authorization_result_from_query(
    const std::map<std::string, std::string>& query);

struct CallbackPage {
    int status = 200;
    std::string body;
};

// 200 "Authorization Successful!" when a code arrived without an error,
// otherwise a 400 error page. State is not inspected here.
CallbackPage render_callback_page(const AuthorizationResult& result);

// Owns a file descriptor; closes it on destruction.
class SocketHandle {
public:
    SocketHandle() = default;
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() { reset(); }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;
    SocketHandle(SocketHandle&& other) noexcept : fd_(other.release()) {}
    SocketHandle& operator=(SocketHandle&& other) noexcept {
        if (this != &other) reset(other.release());
        return *this;
    }

    int get() const { return fd_; }
    int release() { int fd = fd_; fd_ = -1; return fd; }
    void reset(int fd = -1);
    explicit operator bool() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

// The authorization flow talks to the redirect receiver through this seam.
// arm() binds, wait() serves exactly one callback. Splitting the two lets the
// listener be bound before the browser is pointed at the server.
class CallbackListener {
public:
    virtual ~CallbackListener() = default;
    virtual bool arm(const std::string& redirect_uri, std::string& error) = 0;
    virtual CallbackOutcome wait() = 0;

    // arm() + wait()
    CallbackOutcome listen(const std::string& redirect_uri);
};

// Single-use local HTTP listener for the OAuth redirect. Requests to other
// paths (e.g. /favicon.ico) get a 404 and do not count as the callback.
// The listening socket is closed when wait() returns, however it returns.
class CallbackReceiver : public CallbackListener {
public:
    // timeout_seconds: 0 waits forever. cancel: optional flag polled ~1/s.
    explicit CallbackReceiver(Logger& log,
                              long timeout_seconds = 0,
                              const std::atomic<bool>* cancel = nullptr);

    bool arm(const std::string& redirect_uri, std::string& error) override;
    CallbackOutcome wait() override;

    // Port actually bound (differs from the URI when it asked for port 0).
    uint16_t bound_port() const { return bound_port_; }

private:
    Logger& log_;
    long timeout_seconds_;
    const std::atomic<bool>* cancel_;
    SocketHandle listener_;
    RedirectTarget target_;
    uint16_t bound_port_ = 0;
    bool served_ = false;
};

} // namespace mcphost
