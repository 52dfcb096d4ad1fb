#pragma once

#include "rootcache/types.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace rootcache {

// ============================================================================
// HTTP Transport
// ============================================================================

struct FetchResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::vector<uint8_t> data;
    long http_status = 0;
};

// GET capability consumed by the index client and the download pipeline.
// Implementations must treat non-2xx responses as failures and must not
// retry.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Fetch a complete (small) document such as an index or checksum file
    virtual FetchResult fetch(const std::string& url) = 0;

    // Fetch a payload, invoking on_progress after every received chunk
    virtual FetchResult fetch_stream(const std::string& url,
                                     const ProgressCallback& on_progress) = 0;
};

struct CurlOptions {
    std::string user_agent = std::string("rootcache/") + ROOTCACHE_VERSION;
    long connect_timeout_secs = 30;
    long timeout_secs = 0;              // 0 = no overall limit
};

// libcurl-backed transport. Follows redirects and verifies TLS.
class CurlTransport : public HttpTransport {
public:
    CurlTransport() = default;
    explicit CurlTransport(CurlOptions options) : options_(std::move(options)) {}

    FetchResult fetch(const std::string& url) override;
    FetchResult fetch_stream(const std::string& url,
                             const ProgressCallback& on_progress) override;

private:
    CurlOptions options_;
};

} // namespace rootcache
