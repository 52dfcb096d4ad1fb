#pragma once

#include "rootcache/distro.hpp"
#include "rootcache/mirror.hpp"
#include "rootcache/transport.hpp"
#include "rootcache/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace rootcache {

// ============================================================================
// Download & Verification Pipeline
// ============================================================================
//
// Downloads are held in memory and verified before anything touches the
// cache, so an interrupted or mismatching download never produces a cache
// entry. Nothing here retries.

struct DownloadResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;

    std::vector<uint8_t> data;
    std::string sha256;         // Always computed, lowercase hex
    std::string filename;       // Last URL segment

    // Set on ChecksumMismatch
    std::string expected_hash;
    std::string actual_hash;

    // Secondary digest, computed on demand only
    std::string sha512() const;
};

struct VerifyResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string expected;
    std::string actual;
};

// Compare the payload against `expected` using `algorithm`. SHA-256 reuses
// the digest already on the result; SHA-512 is computed only here.
VerifyResult verify_download(const DownloadResult& result,
                             const std::string& expected,
                             HashAlgorithm algorithm);

// Stream a URL into memory, reporting progress, and compute its SHA-256
DownloadResult download_url(HttpTransport& transport,
                            const std::string& url,
                            const ProgressCallback& on_progress);

// Resolve through the unified index of `mirror`, download, and verify the
// SHA-256 published in the index.
DownloadResult download_from_index(HttpTransport& transport,
                                   Distro distro,
                                   const std::string& version,
                                   Arch arch,
                                   const Mirror& mirror,
                                   const ProgressCallback& on_progress);

// Download from the distro's official source without checksum verification.
// Fails with UnsupportedDistro when the distro has no official provider.
DownloadResult download_official(HttpTransport& transport,
                                 Distro distro,
                                 const std::string& version,
                                 Arch arch,
                                 const ProgressCallback& on_progress);

// download_official() followed by verification against the distro's
// published checksum file, using the algorithm the provider declares.
DownloadResult download_official_verified(HttpTransport& transport,
                                          Distro distro,
                                          const std::string& version,
                                          Arch arch,
                                          const ProgressCallback& on_progress);

} // namespace rootcache
