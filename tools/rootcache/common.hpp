/**
 * rootcache CLI - Common utilities and types
 */

#pragma once

#include <rootcache/distro.hpp>
#include <rootcache/manager.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>

namespace rootcache::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string cache_dir;         // --cache-dir
    std::string mirror;            // --mirror
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route library logs to stderr so stdout stays machine-readable.
 */
inline void setup_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("rootcache");
    if (!logger) {
        logger = spdlog::stderr_color_mt("rootcache");
    }
    logger->set_pattern("%^%l%$: %v");
    spdlog::set_default_logger(logger);

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet || opts.json) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode,
                        rootcache::ErrorKind kind = rootcache::ErrorKind::None) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (kind != rootcache::ErrorKind::None) {
            j["kind"] = rootcache::error_kind_to_string(kind);
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }
    char buffer[32];
    if (unit == 0) {
        std::snprintf(buffer, sizeof(buffer), "%llu B", static_cast<unsigned long long>(bytes));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.1f %s", value, units[unit]);
    }
    return buffer;
}

/**
 * Build a manager from the global options.
 * Priority: flags > ROOTCACHE_DIR / ROOTCACHE_MIRROR > defaults
 */
inline std::unique_ptr<rootcache::RootfsManager> make_manager(const GlobalOptions& opts) {
    auto mirror = rootcache::resolve_mirror(opts.mirror);
    if (!mirror.ok) {
        print_error(mirror.error, opts.json);
        return nullptr;
    }

    rootcache::ManagerConfig config;
    config.cache_dir = rootcache::resolve_cache_dir(opts.cache_dir);
    config.mirror = mirror.mirror;

    auto created = rootcache::RootfsManager::create(config);
    if (!created.ok) {
        print_error(created.error, opts.json, created.kind);
        return nullptr;
    }
    return std::move(created.manager);
}

/**
 * Parsed "distro[:version]" plus --arch.
 */
struct Target {
    rootcache::Distro distro = rootcache::Distro::Alpine;
    std::string version;
    rootcache::Arch arch = rootcache::current_arch();
};

inline bool parse_target(const std::string& spec, const std::string& arch_name,
                         const GlobalOptions& opts, Target& out) {
    auto parsed = rootcache::parse_distro_spec(spec);
    if (!parsed.ok) {
        print_error(parsed.error, opts.json, parsed.kind);
        return false;
    }
    out.distro = parsed.distro;
    out.version = parsed.version;

    if (!arch_name.empty()) {
        auto arch = rootcache::parse_arch(arch_name);
        if (!arch.ok) {
            print_error(arch.error, opts.json);
            return false;
        }
        out.arch = arch.arch;
    } else {
        out.arch = rootcache::current_arch();
    }
    return true;
}

/**
 * Progress line on stderr, redrawn in place. Silent in JSON or quiet mode.
 */
inline rootcache::ProgressCallback make_progress_printer(const GlobalOptions& opts) {
    if (opts.json || opts.quiet) {
        return nullptr;
    }
    return [](uint64_t received, uint64_t total) {
        if (total > 0) {
            unsigned percent = static_cast<unsigned>((received * 100) / total);
            std::cerr << "\r  " << format_bytes(received) << " / " << format_bytes(total)
                      << " (" << percent << "%)   " << std::flush;
            if (received >= total) std::cerr << std::endl;
        } else {
            std::cerr << "\r  " << format_bytes(received) << "   " << std::flush;
        }
    };
}

inline nlohmann::json cached_to_json(const rootcache::CachedRootfs& entry) {
    nlohmann::json j;
    j["distro"] = entry.metadata.distro;
    j["version"] = entry.metadata.version;
    j["arch"] = entry.metadata.arch;
    j["sha256"] = entry.metadata.sha256;
    j["filename"] = entry.metadata.filename;
    j["size"] = entry.metadata.size;
    j["downloaded_at"] = entry.metadata.downloaded_at;
    j["path"] = entry.archive_path;
    return j;
}

} // namespace rootcache::cli
