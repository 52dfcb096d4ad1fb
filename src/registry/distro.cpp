#include "rootcache/distro.hpp"

#include <algorithm>
#include <cctype>

namespace rootcache {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

struct ReleaseName {
    const char* version;
    const char* release;
};

const ReleaseName UBUNTU_RELEASES[] = {
    {"20.04", "focal"},
    {"22.04", "jammy"},
    {"24.04", "noble"},
    {"24.10", "oracular"},
    {"25.04", "plucky"},
};

const ReleaseName DEBIAN_RELEASES[] = {
    {"10", "buster"},
    {"11", "bullseye"},
    {"12", "bookworm"},
    {"13", "trixie"},
};

const ReleaseName DEVUAN_RELEASES[] = {
    {"4", "chimaera"},
    {"5", "daedalus"},
    {"6", "excalibur"},
};

template <size_t N>
std::string lookup_release(const ReleaseName (&table)[N], const std::string& version) {
    for (const auto& entry : table) {
        if (version == entry.version) {
            return entry.release;
        }
    }
    return version;
}

} // namespace

const char* distro_slug(Distro d) {
    switch (d) {
        case Distro::Alma: return "alma";
        case Distro::Alpine: return "alpine";
        case Distro::Arch: return "arch";
        case Distro::CentOS: return "centos";
        case Distro::Debian: return "debian";
        case Distro::Devuan: return "devuan";
        case Distro::Fedora: return "fedora";
        case Distro::Gentoo: return "gentoo";
        case Distro::Kali: return "kali";
        case Distro::NixOS: return "nixos";
        case Distro::OpenEuler: return "openeuler";
        case Distro::OpenSuse: return "opensuse";
        case Distro::Oracle: return "oracle";
        case Distro::Rocky: return "rocky";
        case Distro::Ubuntu: return "ubuntu";
        case Distro::Void: return "void";
        default: return "unknown";
    }
}

const char* distro_index_name(Distro d) {
    switch (d) {
        case Distro::Alma: return "almalinux";
        case Distro::Alpine: return "alpine";
        case Distro::Arch: return "archlinux";
        case Distro::CentOS: return "centos";
        case Distro::Debian: return "debian";
        case Distro::Devuan: return "devuan";
        case Distro::Fedora: return "fedora";
        case Distro::Gentoo: return "gentoo";
        case Distro::Kali: return "kali";
        case Distro::NixOS: return "nixos";
        case Distro::OpenEuler: return "openeuler";
        case Distro::OpenSuse: return "opensuse";
        case Distro::Oracle: return "oracle";
        case Distro::Rocky: return "rockylinux";
        case Distro::Ubuntu: return "ubuntu";
        case Distro::Void: return "voidlinux";
        default: return "unknown";
    }
}

std::string default_version(Distro d) {
    switch (d) {
        case Distro::Alma: return "9";
        case Distro::Alpine: return "3.21";
        case Distro::Arch: return "current";
        case Distro::CentOS: return "9-Stream";
        case Distro::Debian: return "12";
        case Distro::Devuan: return "daedalus";
        case Distro::Fedora: return "41";
        case Distro::Gentoo: return "current";
        case Distro::Kali: return "current";
        case Distro::NixOS: return "25.05";
        case Distro::OpenEuler: return "24.03";
        case Distro::OpenSuse: return "tumbleweed";
        case Distro::Oracle: return "9";
        case Distro::Rocky: return "9";
        case Distro::Ubuntu: return "24.04";
        case Distro::Void: return "current";
        default: return "";
    }
}

std::string index_release(Distro d, const std::string& version) {
    switch (d) {
        case Distro::Ubuntu: return lookup_release(UBUNTU_RELEASES, version);
        case Distro::Debian: return lookup_release(DEBIAN_RELEASES, version);
        case Distro::Devuan: return lookup_release(DEVUAN_RELEASES, version);
        default: return version;
    }
}

const std::vector<Distro>& all_distros() {
    static const std::vector<Distro> distros = {
        Distro::Alma, Distro::Alpine, Distro::Arch, Distro::CentOS,
        Distro::Debian, Distro::Devuan, Distro::Fedora, Distro::Gentoo,
        Distro::Kali, Distro::NixOS, Distro::OpenEuler, Distro::OpenSuse,
        Distro::Oracle, Distro::Rocky, Distro::Ubuntu, Distro::Void,
    };
    return distros;
}

bool is_valid_version(const std::string& version) {
    if (version.empty() || version == "." || version == "..") {
        return false;
    }
    return version.find_first_of("/\\") == std::string::npos;
}

DistroSpecParseResult parse_distro_spec(const std::string& spec) {
    DistroSpecParseResult result;

    std::string name = spec;
    std::optional<std::string> version;
    auto colon = spec.find(':');
    if (colon != std::string::npos) {
        name = spec.substr(0, colon);
        version = spec.substr(colon + 1);
    }

    std::string lowered = to_lower(name);
    bool found = false;
    for (Distro d : all_distros()) {
        if (lowered == distro_slug(d) || lowered == distro_index_name(d)) {
            result.distro = d;
            found = true;
            break;
        }
    }

    if (!found) {
        result.kind = ErrorKind::UnsupportedDistro;
        result.error = "unsupported distribution: " + name;
        return result;
    }

    if (version && version->empty()) {
        result.kind = ErrorKind::UnsupportedVersion;
        result.error = "unsupported version (empty) for " + std::string(distro_slug(result.distro));
        return result;
    }

    if (version && !is_valid_version(*version)) {
        result.kind = ErrorKind::UnsupportedVersion;
        result.error = "unsupported version '" + *version + "' for " +
                       std::string(distro_slug(result.distro));
        return result;
    }

    result.version = version ? *version : default_version(result.distro);
    result.ok = true;
    return result;
}

// ============================================================================
// Architectures
// ============================================================================

const char* arch_kernel_name(Arch a) {
    switch (a) {
        case Arch::Aarch64: return "aarch64";
        case Arch::X86_64: return "x86_64";
        default: return "unknown";
    }
}

const char* arch_debian_name(Arch a) {
    switch (a) {
        case Arch::Aarch64: return "arm64";
        case Arch::X86_64: return "amd64";
        default: return "unknown";
    }
}

const char* arch_index_name(Arch a) {
    return arch_debian_name(a);
}

Arch current_arch() {
#if defined(__aarch64__) || defined(_M_ARM64)
    return Arch::Aarch64;
#else
    return Arch::X86_64;
#endif
}

ArchParseResult parse_arch(const std::string& name) {
    ArchParseResult result;
    std::string lowered = to_lower(name);

    for (Arch a : {Arch::Aarch64, Arch::X86_64}) {
        if (lowered == arch_kernel_name(a) || lowered == arch_debian_name(a)) {
            result.arch = a;
            result.ok = true;
            return result;
        }
    }

    result.error = "unsupported architecture: " + name;
    return result;
}

} // namespace rootcache
