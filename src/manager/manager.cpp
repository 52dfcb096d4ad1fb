#include "rootcache/manager.hpp"
#include "rootcache/download.hpp"
#include "rootcache/platform.hpp"
#include "rootcache/provider.hpp"

#include <spdlog/spdlog.h>

namespace rootcache {

namespace {

template <typename R>
EnsureResult ensure_failure(const R& source) {
    EnsureResult result;
    result.kind = source.kind;
    result.error = source.error;
    return result;
}

template <typename R>
bool reject_invalid_version(Distro distro, const std::string& version, R& result) {
    if (is_valid_version(version)) {
        return false;
    }
    result.kind = ErrorKind::UnsupportedVersion;
    result.error = "unsupported version '" + version + "' for " + distro_slug(distro);
    return true;
}

} // namespace

// ============================================================================
// Configuration
// ============================================================================

std::string default_cache_dir() {
    if (auto xdg = get_env("XDG_DATA_HOME"); xdg && !xdg->empty()) {
        return join_path(join_path(*xdg, "rootcache"), "rootfs");
    }
    if (auto home = get_env("HOME"); home && !home->empty()) {
        return join_path(*home, ".local/share/rootcache/rootfs");
    }
    return "/tmp/rootcache/rootfs";
}

std::string resolve_cache_dir(const std::string& override_dir) {
    if (!override_dir.empty()) {
        return override_dir;
    }
    if (auto env = get_env("ROOTCACHE_DIR"); env && !env->empty()) {
        return *env;
    }
    return default_cache_dir();
}

MirrorSelection resolve_mirror(const std::string& override_mirror) {
    MirrorSelection selection;

    std::string text = override_mirror;
    if (text.empty()) {
        if (auto env = get_env("ROOTCACHE_MIRROR"); env && !env->empty()) {
            text = *env;
        }
    }

    if (text.empty()) {
        selection.ok = true;
        return selection;
    }

    auto parsed = parse_mirror(text);
    if (!parsed.ok) {
        selection.error = parsed.error;
        return selection;
    }

    selection.mirror = parsed.mirror;
    selection.ok = true;
    return selection;
}

// ============================================================================
// RootfsManager
// ============================================================================

RootfsManager::RootfsManager(ManagerConfig config, HttpTransport* transport,
                             std::unique_ptr<HttpTransport> owned)
    : config_(std::move(config)),
      owned_transport_(std::move(owned)),
      transport_(transport ? transport : owned_transport_.get()) {}

ManagerCreateResult RootfsManager::create(const ManagerConfig& config, HttpTransport* transport) {
    ManagerCreateResult result;

    ManagerConfig effective = config;
    if (effective.cache_dir.empty()) {
        effective.cache_dir = default_cache_dir();
    }

    if (!create_directories(effective.cache_dir)) {
        result.kind = ErrorKind::Io;
        result.error = "failed to create cache directory: " + effective.cache_dir;
        return result;
    }

    std::unique_ptr<HttpTransport> owned;
    if (transport == nullptr) {
        CurlOptions options;
        options.user_agent = effective.user_agent;
        options.connect_timeout_secs = effective.connect_timeout_secs;
        options.timeout_secs = effective.timeout_secs;
        owned = std::make_unique<CurlTransport>(options);
    }

    spdlog::debug("cache root {}, mirror {}", effective.cache_dir,
                  mirror_to_string(effective.mirror));

    result.manager = std::unique_ptr<RootfsManager>(
        new RootfsManager(std::move(effective), transport, std::move(owned)));
    result.ok = true;
    return result;
}

std::string RootfsManager::entry_dir(Distro distro, const std::string& version, Arch arch) const {
    return join_path(join_path(join_path(config_.cache_dir, distro_slug(distro)), version),
                     arch_kernel_name(arch));
}

CacheLookupResult RootfsManager::lookup(Distro distro, const std::string& version, Arch arch) const {
    CacheLookupResult invalid;
    if (reject_invalid_version(distro, version, invalid)) {
        return invalid;
    }
    return load_cached(entry_dir(distro, version, arch));
}

EnsureResult RootfsManager::store_download(const std::string& dir,
                                           const DownloadResult& download) const {
    if (!download.ok) {
        auto result = ensure_failure(download);
        result.expected_hash = download.expected_hash;
        result.actual_hash = download.actual_hash;
        return result;
    }

    auto stored = store(dir, download);
    if (!stored.ok) {
        return ensure_failure(stored);
    }

    EnsureResult result;
    result.entry = std::move(stored.entry);
    result.ok = true;
    return result;
}

EnsureResult RootfsManager::ensure(Distro distro, const std::string& version, Arch arch,
                                   const ProgressCallback& on_progress) {
    return ensure(distro, version, arch, config_.mirror, on_progress);
}

EnsureResult RootfsManager::ensure(Distro distro, const std::string& version, Arch arch,
                                   const Mirror& mirror, const ProgressCallback& on_progress) {
    EnsureResult invalid;
    if (reject_invalid_version(distro, version, invalid)) {
        return invalid;
    }

    std::string dir = entry_dir(distro, version, arch);

    auto cached = load_cached(dir);
    if (!cached.ok) {
        return ensure_failure(cached);
    }
    if (cached.entry) {
        EnsureResult result;
        result.entry = std::move(*cached.entry);
        result.from_cache = true;
        result.ok = true;
        return result;
    }

    auto download = download_from_index(*transport_, distro, version, arch, mirror, on_progress);
    return store_download(dir, download);
}

EnsureResult RootfsManager::ensure_official(Distro distro, const std::string& version, Arch arch,
                                            const ProgressCallback& on_progress) {
    EnsureResult invalid;
    if (reject_invalid_version(distro, version, invalid)) {
        return invalid;
    }

    std::string dir = entry_dir(distro, version, arch);

    auto cached = load_cached(dir);
    if (!cached.ok) {
        return ensure_failure(cached);
    }
    if (cached.entry) {
        EnsureResult result;
        result.entry = std::move(*cached.entry);
        result.from_cache = true;
        result.ok = true;
        return result;
    }

    auto download = download_official_verified(*transport_, distro, version, arch, on_progress);
    return store_download(dir, download);
}

ResolveResult RootfsManager::resolve(Distro distro, const std::string& version, Arch arch) const {
    return resolve(distro, version, arch, config_.mirror);
}

ResolveResult RootfsManager::resolve(Distro distro, const std::string& version, Arch arch,
                                     const Mirror& mirror) const {
    ImageIndexClient client(mirror, *transport_);
    return client.resolve(distro, version, arch);
}

OfficialResolveResult RootfsManager::resolve_official(Distro distro, const std::string& version,
                                                      Arch arch) const {
    OfficialResolveResult result;

    auto provider = get_official_provider(distro);
    if (!provider) {
        result.kind = ErrorKind::UnsupportedDistro;
        result.error = std::string("no official provider for ") + distro_slug(distro);
        return result;
    }

    result.source.url = provider->rootfs_url(version, arch);
    result.source.checksum_url = provider->checksum_url(version, arch);
    result.source.hash_algorithm = provider->hash_algorithm();
    result.ok = true;
    return result;
}

CacheListResult RootfsManager::list_cached() const {
    return list_all(config_.cache_dir);
}

PruneResult RootfsManager::prune(size_t keep_latest) const {
    return rootcache::prune(config_.cache_dir, keep_latest);
}

} // namespace rootcache
