#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace rootcache {

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class ErrorKind {
    None,
    UnsupportedDistro,
    UnsupportedVersion,
    ChecksumMismatch,
    ChecksumParse,
    ProductNotFound,
    RootfsNotFound,
    UnsupportedArchiveFormat,
    Transport,
    Io,
    MetadataDecode,
};

// Convert error kind to canonical lowercase snake_case string
inline const char* error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::UnsupportedDistro: return "unsupported_distro";
        case ErrorKind::UnsupportedVersion: return "unsupported_version";
        case ErrorKind::ChecksumMismatch: return "checksum_mismatch";
        case ErrorKind::ChecksumParse: return "checksum_parse";
        case ErrorKind::ProductNotFound: return "product_not_found";
        case ErrorKind::RootfsNotFound: return "rootfs_not_found";
        case ErrorKind::UnsupportedArchiveFormat: return "unsupported_archive_format";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Io: return "io";
        case ErrorKind::MetadataDecode: return "metadata_decode";
        default: return "unknown";
    }
}

// ============================================================================
// Hash Algorithms
// ============================================================================

enum class HashAlgorithm {
    Sha256,     // Most distros and the unified index
    Sha512,     // Debian SHA512SUMS
};

inline const char* hash_algorithm_to_string(HashAlgorithm a) {
    switch (a) {
        case HashAlgorithm::Sha256: return "sha256";
        case HashAlgorithm::Sha512: return "sha512";
        default: return "unknown";
    }
}

// ============================================================================
// Progress Reporting
// ============================================================================

// Invoked with (bytes received so far, total bytes or 0 when the server
// does not advertise a length). Runs on the downloading thread.
using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

} // namespace rootcache
