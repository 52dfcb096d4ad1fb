#pragma once

#include <string>
#include <vector>

namespace rootcache {

// ============================================================================
// Unified Image Index Mirrors
// ============================================================================
//
// All mirrors serve the same index schema and image layout; only the base
// URL differs.

enum class MirrorKind {
    Official,   // images.linuxcontainers.org
    Tuna,       // mirrors.tuna.tsinghua.edu.cn/lxc-images
    Ustc,       // mirrors.ustc.edu.cn/lxc-images
    Bfsu,       // mirrors.bfsu.edu.cn/lxc-images
    Custom,     // Any self-hosted base URL
};

struct Mirror {
    MirrorKind kind = MirrorKind::Official;
    std::string custom_url;     // Only used for MirrorKind::Custom

    static Mirror custom(const std::string& url) {
        Mirror m;
        m.kind = MirrorKind::Custom;
        m.custom_url = url;
        return m;
    }

    // Base URL without trailing slash
    std::string base_url() const;

    // "<base>/streams/v1/images.json"
    std::string streams_url() const;

    // "<base>/<path>" for a path taken from the index
    std::string image_url(const std::string& path) const;
};

// Official, Tuna, Ustc, Bfsu
const std::vector<Mirror>& mirror_presets();

// "official", "tuna", ..., or "custom(<url>)"
std::string mirror_to_string(const Mirror& mirror);

struct MirrorParseResult {
    bool ok = false;
    std::string error;
    Mirror mirror;
};

// Accepts a preset name or an http(s):// base URL
MirrorParseResult parse_mirror(const std::string& text);

} // namespace rootcache
