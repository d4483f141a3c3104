// libcurl HTTP client for non-Linux builds. Same public API as
// http_socket.cpp.
#ifndef __linux__

#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace mcphost {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static void apply_abort_hook(CURL* curl) {
    if (g_http_abort_flag) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    }
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

// Routes a 2xx body to the chunk callback and anything else into the
// response body, deciding on the first write once the status is known.
struct StreamContext {
    CURL* curl = nullptr;
    StreamOpenCallback* on_open = nullptr;
    RawChunkCallback* on_chunk = nullptr;
    HttpResponse* response = nullptr;
    bool decided = false;
    bool streaming = false;
    bool stopped = false;
};

static void decide_stream(StreamContext* ctx) {
    if (ctx->decided) return;
    ctx->decided = true;
    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    ctx->streaming = is_success(status);
    if (ctx->streaming && ctx->on_open && *ctx->on_open) (*ctx->on_open)(status);
}

static size_t stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<StreamContext*>(userdata);
    if (ctx->stopped) return 0;

    decide_stream(ctx);
    if (!ctx->streaming) {
        ctx->response->body.append(ptr, total);
        return total;
    }
    if (!(*ctx->on_chunk)(ptr, total)) {
        ctx->stopped = true;
        return 0;
    }
    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl handle with common setup ────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

static void setup_request(CurlRequest& req, const std::string& url,
                           const std::vector<Header>& headers, long timeout) {
    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout);
    apply_abort_hook(req.curl);
}

static void set_post_body(CURL* curl, const std::string& body) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
}

static HttpResponse perform_buffered(CurlRequest& req) {
    HttpResponse response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    CURLcode res = curl_easy_perform(req.curl);
    if (res == CURLE_OK)
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    else
        response.error = curl_easy_strerror(res);
    return response;
}

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::post(const std::string& url,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse CurlHttpClient::get(const std::string& url,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    return http_get(url, headers, timeout_seconds);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    CurlRequest req;
    if (!req) return {0, "", "curl_easy_init failed"};
    setup_request(req, url, headers, timeout_seconds);
    set_post_body(req.curl, body);
    return perform_buffered(req);
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    CurlRequest req;
    if (!req) return {0, "", "curl_easy_init failed"};
    setup_request(req, url, headers, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    return perform_buffered(req);
}

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
    CurlRequest req;
    if (!req) return {0, "", "curl_easy_init failed"};
    // The stream is unbounded: timeout only applies to connecting.
    setup_request(req, url, headers, 0);
    curl_easy_setopt(req.curl, CURLOPT_CONNECTTIMEOUT, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);

    HttpResponse response;
    StreamContext ctx;
    ctx.curl = req.curl;
    ctx.on_open = &on_open;
    ctx.on_chunk = &on_chunk;
    ctx.response = &response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, stream_write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);

    CURLcode res = curl_easy_perform(req.curl);
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    decide_stream(&ctx); // 2xx with an empty body still opens
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        response.error = "aborted";
    } else if (res != CURLE_OK && !(res == CURLE_WRITE_ERROR && ctx.stopped)) {
        response.error = curl_easy_strerror(res);
    }
    return response;
}

} // namespace mcphost

#endif // !__linux__
