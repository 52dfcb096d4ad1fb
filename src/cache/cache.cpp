#include "rootcache/cache.hpp"
#include "rootcache/digest.hpp"
#include "rootcache/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <system_error>

namespace rootcache {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

bool read_text_file(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return false;
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) return false;
    out = buffer.str();
    return true;
}

// Last three components of an entry directory, innermost last
std::vector<std::string> trailing_components(const std::string& entry_dir, size_t count) {
    fs::path p = fs::path(entry_dir).lexically_normal();
    if (p.filename().empty()) {
        p = p.parent_path();
    }

    std::vector<std::string> parts;
    for (const auto& part : p) {
        std::string s = part.string();
        if (s.empty() || s == "/") continue;
        parts.push_back(s);
    }

    std::vector<std::string> result(count, "unknown");
    size_t n = std::min(count, parts.size());
    for (size_t i = 0; i < n; ++i) {
        result[count - n + i] = parts[parts.size() - n + i];
    }
    return result;
}

// Sorted child directories; false on iteration failure
bool list_subdirectories(const fs::path& dir, std::vector<fs::path>& out, std::string& error) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        error = "failed to read directory " + dir.string() + ": " + ec.message();
        return false;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            error = "failed to read directory " + dir.string() + ": " + ec.message();
            return false;
        }
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            out.push_back(it->path());
        }
    }
    std::sort(out.begin(), out.end());
    return true;
}

} // namespace

// ============================================================================
// Metadata
// ============================================================================

MetadataParseResult parse_cache_metadata(const std::string& json_str) {
    MetadataParseResult result;

    try {
        auto j = nlohmann::json::parse(json_str);
        if (!j.is_object()) {
            result.kind = ErrorKind::MetadataDecode;
            result.error = "metadata must be a JSON object";
            return result;
        }

        struct Field {
            const char* key;
            std::string* target;
        };
        const Field fields[] = {
            {"distro", &result.metadata.distro},
            {"version", &result.metadata.version},
            {"arch", &result.metadata.arch},
            {"sha256", &result.metadata.sha256},
            {"filename", &result.metadata.filename},
            {"downloaded_at", &result.metadata.downloaded_at},
        };
        for (const auto& field : fields) {
            auto value = get_string(j, field.key);
            if (!value) {
                result.kind = ErrorKind::MetadataDecode;
                result.error = std::string("metadata field missing or not a string: ") + field.key;
                return result;
            }
            *field.target = *value;
        }

        if (!j.contains("size") || !j["size"].is_number_unsigned()) {
            result.kind = ErrorKind::MetadataDecode;
            result.error = "metadata field missing or not an unsigned integer: size";
            return result;
        }
        result.metadata.size = j["size"].get<uint64_t>();
        result.metadata.sha256 = normalize_hex(result.metadata.sha256);
    } catch (const nlohmann::json::exception& e) {
        result.kind = ErrorKind::MetadataDecode;
        result.error = std::string("failed to parse metadata: ") + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

std::string serialize_cache_metadata(const CacheMetadata& metadata) {
    nlohmann::json j;
    j["distro"] = metadata.distro;
    j["version"] = metadata.version;
    j["arch"] = metadata.arch;
    j["sha256"] = metadata.sha256;
    j["filename"] = metadata.filename;
    j["size"] = metadata.size;
    j["downloaded_at"] = metadata.downloaded_at;
    return j.dump(2);
}

EpochSeconds::EpochSeconds(const std::string& text) {
    if (text.empty()) return;

    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) return;
        value = value * 10 + digit;
    }

    valid_ = true;
    value_ = value;
}

bool EpochSeconds::operator<(const EpochSeconds& other) const {
    if (valid_ != other.valid_) return !valid_;
    return value_ < other.value_;
}

bool EpochSeconds::operator==(const EpochSeconds& other) const {
    return valid_ == other.valid_ && value_ == other.value_;
}

// ============================================================================
// CachedRootfs
// ============================================================================

std::string CachedRootfs::entry_dir() const {
    return get_parent_directory(archive_path);
}

IntegrityResult CachedRootfs::verify_integrity() const {
    IntegrityResult result;

    auto digest = compute_file_digest(HashAlgorithm::Sha256, archive_path);
    if (!digest.ok) {
        result.kind = ErrorKind::Io;
        result.error = digest.error;
        return result;
    }

    result.actual = digest.hex_digest;
    result.valid = digest.hex_digest == metadata.sha256;
    result.ok = true;
    return result;
}

ExtractResult CachedRootfs::extract_to(const std::string& target_dir) const {
    auto detected = detect_archive_format(archive_path);
    if (!detected.ok) {
        ExtractResult result;
        result.kind = detected.kind;
        result.error = detected.error;
        return result;
    }
    return extract_archive(archive_path, target_dir, detected.format);
}

// ============================================================================
// Lookup
// ============================================================================

CacheLookupResult load_entry(const std::string& entry_dir) {
    CacheLookupResult result;
    std::error_code ec;

    std::string metadata_path = join_path(entry_dir, METADATA_FILENAME);
    if (!fs::exists(metadata_path, ec)) {
        result.ok = true;
        return result;
    }

    std::string content;
    if (!read_text_file(metadata_path, content)) {
        result.kind = ErrorKind::Io;
        result.error = "failed to read " + metadata_path;
        return result;
    }

    auto parsed = parse_cache_metadata(content);
    if (!parsed.ok) {
        result.kind = parsed.kind;
        result.error = parsed.error + " (" + metadata_path + ")";
        return result;
    }

    std::string archive_path = join_path(entry_dir, parsed.metadata.filename);
    if (!fs::exists(archive_path, ec)) {
        spdlog::debug("metadata present but archive missing: {}", archive_path);
        result.ok = true;
        return result;
    }

    CachedRootfs entry;
    entry.archive_path = archive_path;
    entry.metadata = std::move(parsed.metadata);
    result.entry = std::move(entry);
    result.ok = true;
    return result;
}

CacheLookupResult load_cached(const std::string& entry_dir) {
    auto result = load_entry(entry_dir);
    if (!result.ok || !result.entry) {
        return result;
    }

    auto integrity = result.entry->verify_integrity();
    if (!integrity.ok) {
        CacheLookupResult failed;
        failed.kind = integrity.kind;
        failed.error = integrity.error;
        return failed;
    }

    if (!integrity.valid) {
        spdlog::warn("cached rootfs integrity check failed, removing {} (expected {}, got {})",
                     result.entry->archive_path, result.entry->metadata.sha256,
                     integrity.actual);
        if (!remove_directory(entry_dir)) {
            spdlog::warn("failed to remove corrupted cache entry {}", entry_dir);
        }
        result.entry.reset();
        return result;
    }

    spdlog::info("cache hit: {}", result.entry->archive_path);
    return result;
}

// ============================================================================
// Store
// ============================================================================

CacheStoreResult store(const std::string& entry_dir, const DownloadResult& download) {
    CacheStoreResult result;

    if (!create_directories(entry_dir)) {
        result.kind = ErrorKind::Io;
        result.error = "failed to create cache directory " + entry_dir;
        return result;
    }

    std::string archive_path = join_path(entry_dir, download.filename);
    auto written = atomic_write_file(archive_path, download.data);
    if (!written.ok) {
        result.kind = ErrorKind::Io;
        result.error = written.error;
        return result;
    }

    auto components = trailing_components(entry_dir, 3);

    CacheMetadata metadata;
    metadata.distro = components[0];
    metadata.version = components[1];
    metadata.arch = components[2];
    metadata.sha256 = download.sha256;
    metadata.filename = download.filename;
    metadata.size = static_cast<uint64_t>(download.data.size());
    metadata.downloaded_at = get_epoch_seconds();

    std::string metadata_path = join_path(entry_dir, METADATA_FILENAME);
    written = atomic_write_file(metadata_path, serialize_cache_metadata(metadata));
    if (!written.ok) {
        result.kind = ErrorKind::Io;
        result.error = written.error;
        return result;
    }

    spdlog::info("cached {} ({} bytes)", archive_path, metadata.size);

    result.entry.archive_path = archive_path;
    result.entry.metadata = std::move(metadata);
    result.ok = true;
    return result;
}

// ============================================================================
// Listing & Pruning
// ============================================================================

CacheListResult list_all(const std::string& cache_dir) {
    CacheListResult result;
    std::error_code ec;

    if (!fs::exists(cache_dir, ec)) {
        result.ok = true;
        return result;
    }

    std::vector<fs::path> distro_dirs;
    if (!list_subdirectories(cache_dir, distro_dirs, result.error)) {
        result.kind = ErrorKind::Io;
        return result;
    }

    for (const auto& distro_dir : distro_dirs) {
        std::vector<fs::path> version_dirs;
        if (!list_subdirectories(distro_dir, version_dirs, result.error)) {
            result.kind = ErrorKind::Io;
            return result;
        }
        for (const auto& version_dir : version_dirs) {
            std::vector<fs::path> arch_dirs;
            if (!list_subdirectories(version_dir, arch_dirs, result.error)) {
                result.kind = ErrorKind::Io;
                return result;
            }
            for (const auto& arch_dir : arch_dirs) {
                auto loaded = load_entry(arch_dir.string());
                if (!loaded.ok) {
                    result.kind = loaded.kind;
                    result.error = loaded.error;
                    return result;
                }
                if (loaded.entry) {
                    result.entries.push_back(std::move(*loaded.entry));
                }
            }
        }
    }

    result.ok = true;
    return result;
}

PruneResult prune(const std::string& cache_dir, size_t keep_latest) {
    return prune(cache_dir, keep_latest, remove_directory);
}

PruneResult prune(const std::string& cache_dir, size_t keep_latest, const RemoveDirectoryFn& remove) {
    PruneResult result;

    auto listed = list_all(cache_dir);
    if (!listed.ok) {
        result.kind = listed.kind;
        result.error = listed.error;
        return result;
    }

    std::map<std::string, std::vector<CachedRootfs>> by_distro;
    for (auto& entry : listed.entries) {
        by_distro[entry.metadata.distro].push_back(std::move(entry));
    }

    for (auto& [distro, entries] : by_distro) {
        std::stable_sort(entries.begin(), entries.end(),
                         [](const CachedRootfs& a, const CachedRootfs& b) {
                             return EpochSeconds(b.metadata.downloaded_at) <
                                    EpochSeconds(a.metadata.downloaded_at);
                         });

        for (size_t i = keep_latest; i < entries.size(); ++i) {
            const auto& old = entries[i];
            std::string dir = old.entry_dir();
            if (remove(dir)) {
                spdlog::info("pruned {} {} ({} bytes)", distro, old.metadata.version,
                             old.metadata.size);
                result.freed_bytes += old.metadata.size;
                ++result.removed;
            } else {
                spdlog::warn("failed to remove cache entry {}", dir);
                ++result.failed;
            }
        }
    }

    result.ok = true;
    return result;
}

} // namespace rootcache
