#include <doctest/doctest.h>
#include <rootcache/provider.hpp>

using namespace rootcache;

TEST_CASE("major-minor transform drops the patch segment") {
    TemplateProvider alpine(ALPINE_SPEC);
    CHECK(alpine.resolve_major_minor("3.21.3") == "3.21");
    CHECK(alpine.resolve_major_minor("3.21") == "3.21");
    CHECK(alpine.resolve_major_minor("edge") == "edge");
}

TEST_CASE("identity transform keeps the version") {
    TemplateProvider fedora(FEDORA_SPEC);
    CHECK(fedora.resolve_major_minor("3.21.3") == "3.21.3");
}

TEST_CASE("alpine urls") {
    TemplateProvider alpine(ALPINE_SPEC);

    CHECK(alpine.rootfs_url("3.21.3", Arch::X86_64) ==
          "https://dl-cdn.alpinelinux.org/alpine/v3.21/releases/x86_64/"
          "alpine-minirootfs-3.21.3-x86_64.tar.gz");

    auto checksum = alpine.checksum_url("3.21.3", Arch::Aarch64);
    REQUIRE(checksum.has_value());
    CHECK(*checksum ==
          "https://dl-cdn.alpinelinux.org/alpine/v3.21/releases/aarch64/"
          "alpine-minirootfs-3.21.3-aarch64.tar.gz.sha256");
}

TEST_CASE("ubuntu urls use codename and debian arch names") {
    TemplateProvider ubuntu(UBUNTU_SPEC);

    CHECK(ubuntu.rootfs_url("24.04", Arch::Aarch64) ==
          "https://cloud-images.ubuntu.com/noble/current/noble-server-cloudimg-arm64-root.tar.xz");
    CHECK(ubuntu.rootfs_url("22.04", Arch::X86_64) ==
          "https://cloud-images.ubuntu.com/jammy/current/jammy-server-cloudimg-amd64-root.tar.xz");
    CHECK(*ubuntu.checksum_url("22.04", Arch::X86_64) ==
          "https://cloud-images.ubuntu.com/jammy/current/SHA256SUMS");
}

TEST_CASE("unmapped codename falls back to the default") {
    TemplateProvider ubuntu(UBUNTU_SPEC);
    CHECK(ubuntu.resolve_codename("99.04") == "noble");

    TemplateProvider debian(DEBIAN_SPEC);
    CHECK(debian.resolve_codename("11") == "bullseye");
    CHECK(debian.resolve_codename("99") == "bookworm");
}

TEST_CASE("debian verifies with sha512") {
    TemplateProvider debian(DEBIAN_SPEC);
    CHECK(debian.hash_algorithm() == HashAlgorithm::Sha512);
    CHECK(debian.rootfs_url("12", Arch::X86_64) ==
          "https://cloud.debian.org/images/cloud/bookworm/latest/debian-12-nocloud-amd64.tar.xz");
    CHECK(*debian.checksum_url("12", Arch::X86_64) ==
          "https://cloud.debian.org/images/cloud/bookworm/latest/SHA512SUMS");
}

TEST_CASE("fedora uses the bsd checksum grammar") {
    TemplateProvider fedora(FEDORA_SPEC);
    CHECK(fedora.rootfs_url("41", Arch::X86_64) ==
          "https://download.fedoraproject.org/pub/fedora/linux/releases/41/Cloud/x86_64/images/"
          "Fedora-Cloud-Base-41-1.2.x86_64.raw.xz");

    auto parsed = fedora.parse_checksum(
        "SHA256 (Fedora-Cloud-Base-41-1.2.x86_64.raw.xz) = 0123abcd\n",
        "Fedora-Cloud-Base-41-1.2.x86_64.raw.xz");
    REQUIRE(parsed.ok);
    CHECK(parsed.hash == "0123abcd");
}

TEST_CASE("unknown placeholders are copied literally") {
    const ResolutionSpec spec = {
        "https://example.org/{channel}/{version}/{arch}.tar.gz",
        nullptr,
        ChecksumFormat::SingleEntry,
        HashAlgorithm::Sha256,
        ArchNaming::Kernel,
        nullptr,
        0,
        "",
        VersionTransform::Identity,
    };
    TemplateProvider provider(spec);

    CHECK(provider.rootfs_url("1.0", Arch::X86_64) == "https://example.org/{channel}/1.0/x86_64.tar.gz");
    CHECK_FALSE(provider.checksum_url("1.0", Arch::X86_64).has_value());
}

TEST_CASE("get_official_provider covers alpine, ubuntu, debian and fedora only") {
    CHECK(get_official_provider(Distro::Alpine).has_value());
    CHECK(get_official_provider(Distro::Ubuntu).has_value());
    CHECK(get_official_provider(Distro::Debian).has_value());
    CHECK(get_official_provider(Distro::Fedora).has_value());
    CHECK_FALSE(get_official_provider(Distro::Arch).has_value());
    CHECK_FALSE(get_official_provider(Distro::Rocky).has_value());
}
