#include "rootcache/transport.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace rootcache {

namespace {

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// Global curl initialization (thread-safe in modern libcurl)
class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

struct WriteContext {
    CURL* handle = nullptr;
    std::vector<uint8_t>* buffer = nullptr;
    const ProgressCallback* on_progress = nullptr;
};

// Callback for libcurl to write received data
size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    size_t total = size * nmemb;
    ctx->buffer->insert(ctx->buffer->end(), ptr, ptr + total);

    if (ctx->on_progress && *ctx->on_progress) {
        curl_off_t length = -1;
        curl_easy_getinfo(ctx->handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        uint64_t advertised = length > 0 ? static_cast<uint64_t>(length) : 0;
        (*ctx->on_progress)(static_cast<uint64_t>(ctx->buffer->size()), advertised);
    }
    return total;
}

FetchResult perform_get(const CurlOptions& options,
                        const std::string& url,
                        const ProgressCallback* on_progress) {
    FetchResult result;

    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        result.kind = ErrorKind::Transport;
        result.error = "failed to initialize CURL";
        return result;
    }

    std::vector<uint8_t> buffer;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    WriteContext ctx;
    ctx.handle = curl.get();
    ctx.buffer = &buffer;
    ctx.on_progress = on_progress;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    // Stop on HTTP >= 400 before the error body is delivered as payload
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);

    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options.connect_timeout_secs);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options.timeout_secs);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options.user_agent.c_str());

    spdlog::debug("GET {}", url);
    CURLcode res = curl_easy_perform(curl.get());

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);

    if (res != CURLE_OK) {
        result.kind = ErrorKind::Transport;
        result.error = "HTTP request failed for " + url + ": " +
                      (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        return result;
    }

    if (result.http_status < 200 || result.http_status >= 300) {
        result.kind = ErrorKind::Transport;
        result.error = "HTTP " + std::to_string(result.http_status) + " for " + url;
        return result;
    }

    result.data = std::move(buffer);
    result.ok = true;
    return result;
}

} // namespace

FetchResult CurlTransport::fetch(const std::string& url) {
    return perform_get(options_, url, nullptr);
}

FetchResult CurlTransport::fetch_stream(const std::string& url,
                                        const ProgressCallback& on_progress) {
    return perform_get(options_, url, &on_progress);
}

} // namespace rootcache
