#pragma once

#include "rootcache/download.hpp"
#include "rootcache/extract.hpp"
#include "rootcache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rootcache {

// ============================================================================
// Cache Entry Metadata
// ============================================================================
//
// Layout: <root>/<distro>/<version>/<arch>/{metadata.json, <archive>}
// The directory hierarchy is the only index.

inline constexpr const char* METADATA_FILENAME = "metadata.json";

struct CacheMetadata {
    std::string distro;
    std::string version;
    std::string arch;
    std::string sha256;         // Lowercase hex
    std::string filename;
    uint64_t size = 0;
    std::string downloaded_at;  // Decimal Unix epoch seconds
};

struct MetadataParseResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    CacheMetadata metadata;
};

MetadataParseResult parse_cache_metadata(const std::string& json_str);

std::string serialize_cache_metadata(const CacheMetadata& metadata);

// Ordering key for downloaded_at. Compares numerically so that "999" sorts
// before "1000"; values that are not decimal sort before all valid ones.
class EpochSeconds {
public:
    explicit EpochSeconds(const std::string& text);

    bool valid() const { return valid_; }
    uint64_t value() const { return value_; }

    bool operator<(const EpochSeconds& other) const;
    bool operator==(const EpochSeconds& other) const;

private:
    bool valid_ = false;
    uint64_t value_ = 0;
};

// ============================================================================
// Cached Rootfs Handle
// ============================================================================

struct IntegrityResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    bool valid = false;         // Archive digest matches metadata.sha256
    std::string actual;
};

struct CachedRootfs {
    std::string archive_path;
    CacheMetadata metadata;

    std::string entry_dir() const;

    // Streaming SHA-256 over the archive (8 KiB reads)
    IntegrityResult verify_integrity() const;

    // Detects the format from the archive name; unsupported names fail
    // before the target directory is touched.
    ExtractResult extract_to(const std::string& target_dir) const;
};

// ============================================================================
// Cache Operations
// ============================================================================

// ok with no entry means "not cached"
struct CacheLookupResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::optional<CachedRootfs> entry;
};

struct CacheStoreResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    CachedRootfs entry;
};

struct CacheListResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::vector<CachedRootfs> entries;
};

struct PruneResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    uint64_t freed_bytes = 0;   // Only entries whose removal succeeded
    size_t removed = 0;
    size_t failed = 0;
};

// Verifying lookup. A corrupt entry is evicted (best effort) and reported
// as not cached.
CacheLookupResult load_cached(const std::string& entry_dir);

// Metadata-only lookup; the archive is checked for existence, not content.
CacheLookupResult load_entry(const std::string& entry_dir);

// Write the archive and metadata.json into entry_dir. distro, version and
// arch are taken from the last three components of entry_dir.
CacheStoreResult store(const std::string& entry_dir, const DownloadResult& download);

// Walk <root>/<distro>/<version>/<arch>; a missing root yields an empty list
CacheListResult list_all(const std::string& cache_dir);

// Returns false when the directory could not be removed
using RemoveDirectoryFn = std::function<bool(const std::string&)>;

// Keep the newest keep_latest entries per distro, remove the rest
PruneResult prune(const std::string& cache_dir, size_t keep_latest);
PruneResult prune(const std::string& cache_dir, size_t keep_latest, const RemoveDirectoryFn& remove);

} // namespace rootcache
