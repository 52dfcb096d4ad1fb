#include "rootcache/provider.hpp"

#include <unordered_map>

namespace rootcache {

// ============================================================================
// Static Specifications
// ============================================================================

namespace {

const CodenameEntry UBUNTU_CODENAMES[] = {
    {"20.04", "focal"},
    {"22.04", "jammy"},
    {"24.04", "noble"},
    {"24.10", "oracular"},
    {"25.04", "plucky"},
};

const CodenameEntry DEBIAN_CODENAMES[] = {
    {"10", "buster"},
    {"11", "bullseye"},
    {"12", "bookworm"},
    {"13", "trixie"},
};

} // namespace

const ResolutionSpec ALPINE_SPEC = {
    "https://dl-cdn.alpinelinux.org/alpine/v{major_minor}/releases/{arch}/alpine-minirootfs-{version}-{arch}.tar.gz",
    "https://dl-cdn.alpinelinux.org/alpine/v{major_minor}/releases/{arch}/alpine-minirootfs-{version}-{arch}.tar.gz.sha256",
    ChecksumFormat::SingleEntry,
    HashAlgorithm::Sha256,
    ArchNaming::Kernel,
    nullptr,
    0,
    "",
    VersionTransform::MajorMinor,
};

const ResolutionSpec UBUNTU_SPEC = {
    "https://cloud-images.ubuntu.com/{codename}/current/{codename}-server-cloudimg-{arch}-root.tar.xz",
    "https://cloud-images.ubuntu.com/{codename}/current/SHA256SUMS",
    ChecksumFormat::GnuCoreutils,
    HashAlgorithm::Sha256,
    ArchNaming::Debian,
    UBUNTU_CODENAMES,
    sizeof(UBUNTU_CODENAMES) / sizeof(UBUNTU_CODENAMES[0]),
    "noble",
    VersionTransform::Identity,
};

const ResolutionSpec DEBIAN_SPEC = {
    "https://cloud.debian.org/images/cloud/{codename}/latest/debian-{version}-nocloud-{arch}.tar.xz",
    "https://cloud.debian.org/images/cloud/{codename}/latest/SHA512SUMS",
    ChecksumFormat::GnuCoreutils,
    HashAlgorithm::Sha512,
    ArchNaming::Debian,
    DEBIAN_CODENAMES,
    sizeof(DEBIAN_CODENAMES) / sizeof(DEBIAN_CODENAMES[0]),
    "bookworm",
    VersionTransform::Identity,
};

const ResolutionSpec FEDORA_SPEC = {
    "https://download.fedoraproject.org/pub/fedora/linux/releases/{version}/Cloud/{arch}/images/Fedora-Cloud-Base-{version}-1.2.{arch}.raw.xz",
    "https://download.fedoraproject.org/pub/fedora/linux/releases/{version}/Cloud/{arch}/images/Fedora-Cloud-{version}-1.2-{arch}-CHECKSUM",
    ChecksumFormat::Bsd,
    HashAlgorithm::Sha256,
    ArchNaming::Kernel,
    nullptr,
    0,
    "",
    VersionTransform::Identity,
};

// ============================================================================
// Template Provider
// ============================================================================

std::string TemplateProvider::resolve_codename(const std::string& version) const {
    for (size_t i = 0; i < spec_->codename_count; ++i) {
        if (version == spec_->codename_table[i].version) {
            return spec_->codename_table[i].codename;
        }
    }
    return spec_->default_codename;
}

std::string TemplateProvider::resolve_major_minor(const std::string& version) const {
    if (spec_->version_transform == VersionTransform::Identity) {
        return version;
    }

    // "3.21.3" -> "3.21"; "3.21" has no third segment and stays as is
    auto first_dot = version.find('.');
    if (first_dot == std::string::npos) {
        return version;
    }
    auto second_dot = version.find('.', first_dot + 1);
    if (second_dot == std::string::npos) {
        return version;
    }
    return version.substr(0, second_dot);
}

std::string TemplateProvider::resolve_url(const std::string& tmpl,
                                          const std::string& version,
                                          Arch arch) const {
    const std::unordered_map<std::string, std::string> values = {
        {"version", version},
        {"arch", spec_->arch_naming == ArchNaming::Kernel ? arch_kernel_name(arch)
                                                          : arch_debian_name(arch)},
        {"codename", resolve_codename(version)},
        {"major_minor", resolve_major_minor(version)},
    };

    std::string output;
    output.reserve(tmpl.size() + 64);

    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] == '{') {
            size_t close = tmpl.find('}', i + 1);
            if (close != std::string::npos) {
                auto it = values.find(tmpl.substr(i + 1, close - i - 1));
                if (it != values.end()) {
                    output += it->second;
                    i = close + 1;
                    continue;
                }
            }
        }
        // Not a known placeholder, copy literally
        output += tmpl[i];
        ++i;
    }

    return output;
}

std::string TemplateProvider::rootfs_url(const std::string& version, Arch arch) const {
    return resolve_url(spec_->rootfs_url, version, arch);
}

std::optional<std::string> TemplateProvider::checksum_url(const std::string& version,
                                                          Arch arch) const {
    if (spec_->checksum_url == nullptr) {
        return std::nullopt;
    }
    return resolve_url(spec_->checksum_url, version, arch);
}

ChecksumParseResult TemplateProvider::parse_checksum(const std::string& content,
                                                     const std::string& filename) const {
    return parse_checksum_file(spec_->checksum_format, content, filename);
}

std::optional<TemplateProvider> get_official_provider(Distro distro) {
    switch (distro) {
        case Distro::Alpine: return TemplateProvider(ALPINE_SPEC);
        case Distro::Ubuntu: return TemplateProvider(UBUNTU_SPEC);
        case Distro::Debian: return TemplateProvider(DEBIAN_SPEC);
        case Distro::Fedora: return TemplateProvider(FEDORA_SPEC);
        default: return std::nullopt;
    }
}

} // namespace rootcache
