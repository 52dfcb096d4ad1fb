#pragma once

#include "rootcache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rootcache {

// ============================================================================
// Content Digests (OpenSSL EVP)
// ============================================================================

struct DigestResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string
};

// Incremental digest over data supplied in chunks
class Digester {
public:
    explicit Digester(HashAlgorithm algorithm);
    ~Digester();

    Digester(const Digester&) = delete;
    Digester& operator=(const Digester&) = delete;

    // Returns false once any update has failed; finish() then reports it
    bool update(const void* data, size_t len);
    DigestResult finish();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

DigestResult compute_digest(HashAlgorithm algorithm, const std::vector<uint8_t>& data);

// Streams the file through a fixed 8 KiB buffer; memory use does not depend
// on the file size.
DigestResult compute_file_digest(HashAlgorithm algorithm, const std::string& file_path);

// Lowercase a hex string so digests from different sources compare equal
std::string normalize_hex(const std::string& hex);

} // namespace rootcache
