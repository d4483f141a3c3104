#pragma once
#include <string>
#include <vector>
#include <functional>
#include <utility>
#include <atomic>

namespace mcphost {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;  // 0 = no response (connect/write/parse failure)
    std::string body;
    std::string error;     // transport failure, including mid-body read errors
};

inline bool is_success(long status_code) {
    return status_code >= 200 && status_code < 300;
}

inline Header bearer_header(const std::string& token) {
    return {"Authorization", "Bearer " + token};
}

// Raw-chunk streaming callback: receives raw (de-chunked) body bytes.
// Return false to stop reading.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Invoked once with the status code when a 2xx response head has been read,
// before the first body chunk.
using StreamOpenCallback = std::function<void(long status_code)>;

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120) = 0;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;

    // GET with an incrementally delivered body. A non-2xx body is read whole
    // into the returned response and neither callback runs. For 2xx the
    // returned body is empty; error is set if the body ended by read failure
    // or abort rather than by the server closing it.
    virtual HttpResponse stream_get_raw(const std::string& url,
                                        const std::vector<Header>& headers,
                                        StreamOpenCallback on_open,
                                        RawChunkCallback on_chunk,
                                        long timeout_seconds = 30);
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Other platforms: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

// HTTP POST
HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = 120);

// HTTP GET
HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30);

// HTTP GET with raw-chunk streaming (no SSE parsing — caller parses)
HttpResponse http_stream_get_raw(const std::string& url,
                                 const std::vector<Header>& headers,
                                 StreamOpenCallback on_open,
                                 RawChunkCallback on_chunk,
                                 long timeout_seconds = 30);

} // namespace mcphost
