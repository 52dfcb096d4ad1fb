#pragma once

#include "rootcache/types.hpp"

#include <string>
#include <vector>

namespace rootcache {

// ============================================================================
// Distribution Registry
// ============================================================================

enum class Distro {
    Alma,
    Alpine,
    Arch,
    CentOS,
    Debian,
    Devuan,
    Fedora,
    Gentoo,
    Kali,
    NixOS,
    OpenEuler,
    OpenSuse,
    Oracle,
    Rocky,
    Ubuntu,
    Void,
};

// Identifier used in cache paths (e.g. "alpine", "rocky")
const char* distro_slug(Distro d);

// Name used by the unified image index (e.g. "rockylinux", "voidlinux")
const char* distro_index_name(Distro d);

// Version used when the caller does not supply one
std::string default_version(Distro d);

// Map a user-facing version to the release name used in index product keys.
// Ubuntu, Debian and Devuan use codenames ("24.04" -> "noble"); every other
// distro, and any unmapped version, passes through unchanged.
std::string index_release(Distro d, const std::string& version);

// All 16 supported distributions in declaration order
const std::vector<Distro>& all_distros();

// Parse "name" or "name:version". Names are case-insensitive and accept the
// aliases almalinux, archlinux, rockylinux and voidlinux. A missing version
// yields default_version().
struct DistroSpecParseResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    Distro distro = Distro::Alpine;
    std::string version;
};

DistroSpecParseResult parse_distro_spec(const std::string& spec);

// A version names exactly one cache directory level: non-empty, not "." or
// "..", and free of path separators
bool is_valid_version(const std::string& version);

// ============================================================================
// Architectures
// ============================================================================

enum class Arch {
    Aarch64,
    X86_64,
};

// Kernel style: "aarch64" / "x86_64"
const char* arch_kernel_name(Arch a);

// Debian style: "arm64" / "amd64"
const char* arch_debian_name(Arch a);

// Unified index style, identical to the Debian rendering
const char* arch_index_name(Arch a);

// Architecture this binary was compiled for
Arch current_arch();

// Accepts any of the three renderings
struct ArchParseResult {
    bool ok = false;
    std::string error;
    Arch arch = Arch::X86_64;
};

ArchParseResult parse_arch(const std::string& name);

} // namespace rootcache
