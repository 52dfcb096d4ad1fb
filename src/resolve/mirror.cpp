#include "rootcache/mirror.hpp"

#include <algorithm>
#include <cctype>

namespace rootcache {

std::string Mirror::base_url() const {
    switch (kind) {
        case MirrorKind::Official: return "https://images.linuxcontainers.org";
        case MirrorKind::Tuna: return "https://mirrors.tuna.tsinghua.edu.cn/lxc-images";
        case MirrorKind::Ustc: return "https://mirrors.ustc.edu.cn/lxc-images";
        case MirrorKind::Bfsu: return "https://mirrors.bfsu.edu.cn/lxc-images";
        case MirrorKind::Custom: {
            std::string url = custom_url;
            while (!url.empty() && url.back() == '/') {
                url.pop_back();
            }
            return url;
        }
    }
    return "";
}

std::string Mirror::streams_url() const {
    return base_url() + "/streams/v1/images.json";
}

std::string Mirror::image_url(const std::string& path) const {
    return base_url() + "/" + path;
}

const std::vector<Mirror>& mirror_presets() {
    static const std::vector<Mirror> presets = [] {
        std::vector<Mirror> v;
        for (MirrorKind k : {MirrorKind::Official, MirrorKind::Tuna,
                             MirrorKind::Ustc, MirrorKind::Bfsu}) {
            Mirror m;
            m.kind = k;
            v.push_back(m);
        }
        return v;
    }();
    return presets;
}

std::string mirror_to_string(const Mirror& mirror) {
    switch (mirror.kind) {
        case MirrorKind::Official: return "official";
        case MirrorKind::Tuna: return "tuna";
        case MirrorKind::Ustc: return "ustc";
        case MirrorKind::Bfsu: return "bfsu";
        case MirrorKind::Custom: return "custom(" + mirror.custom_url + ")";
    }
    return "unknown";
}

MirrorParseResult parse_mirror(const std::string& text) {
    MirrorParseResult result;

    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& preset : mirror_presets()) {
        if (lowered == mirror_to_string(preset)) {
            result.mirror = preset;
            result.ok = true;
            return result;
        }
    }

    if (lowered.rfind("https://", 0) == 0 || lowered.rfind("http://", 0) == 0) {
        result.mirror = Mirror::custom(text);
        result.ok = true;
        return result;
    }

    result.error = "unknown mirror '" + text + "', expected official, tuna, ustc, bfsu or a URL";
    return result;
}

} // namespace rootcache
