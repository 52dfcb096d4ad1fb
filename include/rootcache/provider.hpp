#pragma once

#include "rootcache/checksum.hpp"
#include "rootcache/distro.hpp"
#include "rootcache/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace rootcache {

// ============================================================================
// Resolution Specifications
// ============================================================================
//
// Every distribution with an official download source is described by one
// immutable ResolutionSpec record. A single TemplateProvider interprets any
// record; adding a distribution is a new record, never new code.
//
// URL templates support these placeholders:
//   {version}      raw version string ("3.21.3")
//   {arch}         architecture rendered per arch_naming
//   {codename}     codename_table lookup, default_codename on a miss
//   {major_minor}  version after version_transform ("3.21.3" -> "3.21")
//
// Substitution is literal. Template text must not contain a placeholder
// token as literal content.

enum class ArchNaming {
    Kernel,     // aarch64 / x86_64
    Debian,     // arm64 / amd64
};

enum class VersionTransform {
    Identity,
    MajorMinor,
};

struct CodenameEntry {
    const char* version;
    const char* codename;
};

struct ResolutionSpec {
    const char* rootfs_url;
    const char* checksum_url;           // nullptr when the distro publishes none
    ChecksumFormat checksum_format;
    HashAlgorithm hash_algorithm;
    ArchNaming arch_naming;
    const CodenameEntry* codename_table; // nullptr when the distro has none
    size_t codename_count;
    const char* default_codename;
    VersionTransform version_transform;
};

extern const ResolutionSpec ALPINE_SPEC;
extern const ResolutionSpec UBUNTU_SPEC;
extern const ResolutionSpec DEBIAN_SPEC;
extern const ResolutionSpec FEDORA_SPEC;

// ============================================================================
// Template Provider
// ============================================================================

class TemplateProvider {
public:
    explicit TemplateProvider(const ResolutionSpec& spec) : spec_(&spec) {}

    std::string rootfs_url(const std::string& version, Arch arch) const;
    std::optional<std::string> checksum_url(const std::string& version, Arch arch) const;
    ChecksumParseResult parse_checksum(const std::string& content,
                                       const std::string& filename) const;
    HashAlgorithm hash_algorithm() const { return spec_->hash_algorithm; }

    // Individual placeholder resolution, exposed for diagnostics and tests
    std::string resolve_codename(const std::string& version) const;
    std::string resolve_major_minor(const std::string& version) const;

    const ResolutionSpec& spec() const { return *spec_; }

private:
    std::string resolve_url(const std::string& tmpl, const std::string& version, Arch arch) const;

    const ResolutionSpec* spec_;
};

// Official provider for alpine, ubuntu, debian and fedora. Every other distro
// has no official provider and must resolve through the unified index.
std::optional<TemplateProvider> get_official_provider(Distro distro);

} // namespace rootcache
