#pragma once

/**
 * @file manager.hpp
 * @brief High-level entry point tying resolution, download and cache together
 *
 * @example
 * ```cpp
 * rootcache::ManagerConfig config;
 * config.cache_dir = rootcache::default_cache_dir();
 *
 * auto created = rootcache::RootfsManager::create(config);
 * if (created.ok) {
 *     auto ensured = created.manager->ensure(rootcache::Distro::Alpine, "3.21",
 *                                           rootcache::Arch::X86_64);
 *     if (ensured.ok) {
 *         ensured.entry.extract_to("/tmp/alpine-root");
 *     }
 * }
 * ```
 */

#include "rootcache/cache.hpp"
#include "rootcache/distro.hpp"
#include "rootcache/image_index.hpp"
#include "rootcache/mirror.hpp"
#include "rootcache/transport.hpp"
#include "rootcache/types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace rootcache {

// ============================================================================
// Configuration
// ============================================================================

struct ManagerConfig {
    std::string cache_dir;
    Mirror mirror;
    std::string user_agent = std::string("rootcache/") + ROOTCACHE_VERSION;
    long connect_timeout_secs = 30;
    long timeout_secs = 0;              // 0 = no overall limit
};

/// $XDG_DATA_HOME/rootcache/rootfs, else $HOME/.local/share/rootcache/rootfs,
/// else /tmp/rootcache/rootfs
std::string default_cache_dir();

/// Priority: explicit override > $ROOTCACHE_DIR > default_cache_dir()
std::string resolve_cache_dir(const std::string& override_dir = "");

struct MirrorSelection {
    bool ok = false;
    std::string error;
    Mirror mirror;
};

/// Priority: explicit override > $ROOTCACHE_MIRROR > official
MirrorSelection resolve_mirror(const std::string& override_mirror = "");

// ============================================================================
// Results
// ============================================================================

struct EnsureResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    CachedRootfs entry;
    bool from_cache = false;

    // Set on ChecksumMismatch
    std::string expected_hash;
    std::string actual_hash;
};

struct OfficialSource {
    std::string url;
    std::optional<std::string> checksum_url;
    HashAlgorithm hash_algorithm = HashAlgorithm::Sha256;
};

struct OfficialResolveResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    OfficialSource source;
};

class RootfsManager;

struct ManagerCreateResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::unique_ptr<RootfsManager> manager;
};

// ============================================================================
// RootfsManager
// ============================================================================

/**
 * @brief Cache-first access to distribution root filesystems
 *
 * Every ensure call checks the verified cache first; only a miss (including
 * a corrupt entry that was just evicted) goes to the network. Nothing is
 * written to the cache until the payload has been verified in memory.
 */
class RootfsManager {
public:
    /**
     * @brief Create a manager, creating the cache root if needed
     * @param config Cache location, mirror and transport options
     * @param transport Optional transport; when null a CurlTransport built
     *        from config is owned by the manager. A supplied transport must
     *        outlive the manager.
     */
    static ManagerCreateResult create(const ManagerConfig& config,
                                      HttpTransport* transport = nullptr);

    const ManagerConfig& config() const { return config_; }
    const std::string& cache_dir() const { return config_.cache_dir; }

    /// <cache>/<distro>/<version>/<arch>, arch in kernel style
    std::string entry_dir(Distro distro, const std::string& version, Arch arch) const;

    /**
     * @brief Return a verified cached rootfs, downloading from the unified
     *        index of the configured mirror on a miss
     */
    EnsureResult ensure(Distro distro, const std::string& version, Arch arch,
                        const ProgressCallback& on_progress = nullptr);

    /// Same as ensure() with an explicit mirror
    EnsureResult ensure(Distro distro, const std::string& version, Arch arch,
                        const Mirror& mirror, const ProgressCallback& on_progress);

    /**
     * @brief Return a verified cached rootfs, downloading from the distro's
     *        official source and verifying its published checksum on a miss
     */
    EnsureResult ensure_official(Distro distro, const std::string& version, Arch arch,
                                 const ProgressCallback& on_progress = nullptr);

    /// Resolve through the unified index without downloading
    ResolveResult resolve(Distro distro, const std::string& version, Arch arch) const;
    ResolveResult resolve(Distro distro, const std::string& version, Arch arch,
                          const Mirror& mirror) const;

    /// Resolve the official download and checksum URLs without downloading
    OfficialResolveResult resolve_official(Distro distro, const std::string& version,
                                           Arch arch) const;

    /// Verified lookup only; never touches the network
    CacheLookupResult lookup(Distro distro, const std::string& version, Arch arch) const;

    CacheListResult list_cached() const;

    PruneResult prune(size_t keep_latest) const;

private:
    RootfsManager(ManagerConfig config, HttpTransport* transport,
                  std::unique_ptr<HttpTransport> owned);

    EnsureResult store_download(const std::string& dir, const DownloadResult& download) const;

    ManagerConfig config_;
    std::unique_ptr<HttpTransport> owned_transport_;
    HttpTransport* transport_;
};

} // namespace rootcache
