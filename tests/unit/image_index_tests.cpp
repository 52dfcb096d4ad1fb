#include <doctest/doctest.h>
#include <rootcache/image_index.hpp>

#include "test_helpers.hpp"

using namespace rootcache;

namespace {

const char* TWO_BUILDS_INDEX = R"JSON({
  "format": "products:1.0",
  "products": {
    "alpine:3.21:amd64:default": {
      "arch": "amd64",
      "os": "Alpine",
      "release": "3.21",
      "release_title": "3.21",
      "variant": "default",
      "versions": {
        "20260217_13:00": {
          "items": {
            "root.tar.xz": {
              "ftype": "root.tar.xz",
              "sha256": "aabbccdd",
              "size": 3000000,
              "path": "images/alpine/3.21/amd64/default/20260217_13:00/rootfs.tar.xz"
            }
          }
        },
        "20260218_13:00": {
          "items": {
            "lxd.tar.xz": {
              "ftype": "lxd.tar.xz",
              "sha256": "11111111",
              "size": 800,
              "path": "images/alpine/3.21/amd64/default/20260218_13:00/lxd.tar.xz"
            },
            "root.tar.xz": {
              "ftype": "root.tar.xz",
              "sha256": "EEFF0011",
              "size": 3100000,
              "path": "images/alpine/3.21/amd64/default/20260218_13:00/rootfs.tar.xz"
            }
          }
        }
      }
    }
  }
})JSON";

ImageIndex parse_or_fail(const std::string& json) {
    auto parsed = parse_image_index(json);
    REQUIRE(parsed.ok);
    return parsed.index;
}

} // namespace

TEST_CASE("product_key renders index names, codenames and debian arch") {
    CHECK(product_key(Distro::Alpine, "3.21", Arch::X86_64, "default") == "alpine:3.21:amd64:default");
    CHECK(product_key(Distro::Ubuntu, "24.04", Arch::Aarch64, "cloud") == "ubuntu:noble:arm64:cloud");
    CHECK(product_key(Distro::Rocky, "9", Arch::X86_64, "default") == "rockylinux:9:amd64:default");
}

TEST_CASE("variant priority tries default before cloud") {
    REQUIRE(VARIANT_PRIORITY.size() == 2);
    CHECK(std::string(VARIANT_PRIORITY[0]) == "default");
    CHECK(std::string(VARIANT_PRIORITY[1]) == "cloud");
}

TEST_CASE("build timestamps order lexicographically") {
    CHECK(BuildTimestamp("20260217_13:00") < BuildTimestamp("20260218_13:00"));
    CHECK(BuildTimestamp("20260218_07:42") < BuildTimestamp("20260218_13:00"));
    CHECK_FALSE(BuildTimestamp("20260218_13:00") < BuildTimestamp("20260218_13:00"));
}

TEST_CASE("resolve selects the latest build") {
    FakeTransport transport;
    ImageIndexClient client(Mirror{}, transport);
    auto index = parse_or_fail(TWO_BUILDS_INDEX);

    auto result = client.resolve_from_index(index, Distro::Alpine, "3.21", Arch::X86_64);
    REQUIRE(result.ok);
    CHECK(result.build == "20260218_13:00");
    CHECK(result.product_key == "alpine:3.21:amd64:default");
    CHECK(result.image.sha256 == "eeff0011");
    CHECK(result.image.size == 3100000);
    CHECK(result.image.filename == "rootfs.tar.xz");
    CHECK(result.image.url ==
          "https://images.linuxcontainers.org/images/alpine/3.21/amd64/default/20260218_13:00/rootfs.tar.xz");
}

TEST_CASE("resolve fetches the index from the selected mirror") {
    FakeTransport transport;
    auto mirror = Mirror::custom("https://mirror.example.org/lxc/");
    transport.serve("https://mirror.example.org/lxc/streams/v1/images.json", TWO_BUILDS_INDEX);

    ImageIndexClient client(mirror, transport);
    auto result = client.resolve(Distro::Alpine, "3.21", Arch::X86_64);
    REQUIRE(result.ok);
    CHECK(result.image.url ==
          "https://mirror.example.org/lxc/images/alpine/3.21/amd64/default/20260218_13:00/rootfs.tar.xz");
}

TEST_CASE("resolve falls back to the cloud variant") {
    std::string json = make_index_json(
        "ubuntu:noble:amd64:cloud",
        {{"20260301_07:42", {"abcd", "images/ubuntu/noble/amd64/cloud/20260301_07:42/rootfs.tar.xz"}}});

    FakeTransport transport;
    ImageIndexClient client(Mirror{}, transport);
    auto result = client.resolve_from_index(parse_or_fail(json), Distro::Ubuntu, "24.04", Arch::X86_64);
    REQUIRE(result.ok);
    CHECK(result.product_key == "ubuntu:noble:amd64:cloud");
    CHECK(result.image.sha256 == "abcd");
}

TEST_CASE("resolve reports a missing product") {
    FakeTransport transport;
    ImageIndexClient client(Mirror{}, transport);
    auto index = parse_or_fail(TWO_BUILDS_INDEX);

    auto result = client.resolve_from_index(index, Distro::Alpine, "3.20", Arch::Aarch64);
    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::ProductNotFound);
}

TEST_CASE("resolve reports a product without a rootfs item") {
    const char* json = R"JSON({
      "products": {
        "fedora:41:amd64:default": {
          "versions": {
            "20260101_00:00": {
              "items": {
                "disk.qcow2": {"ftype": "disk-kvm.img", "sha256": "aa", "size": 1, "path": "images/x/disk.qcow2"}
              }
            }
          }
        }
      }
    })JSON";

    FakeTransport transport;
    ImageIndexClient client(Mirror{}, transport);
    auto result = client.resolve_from_index(parse_or_fail(json), Distro::Fedora, "41", Arch::X86_64);
    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::RootfsNotFound);
}

TEST_CASE("resolve reports a product without builds") {
    const char* json = R"JSON({"products": {"void:current:amd64:default": {"versions": {}}}})JSON";

    FakeTransport transport;
    ImageIndexClient client(Mirror{}, transport);
    auto result = client.resolve_from_index(parse_or_fail(json), Distro::Void, "current", Arch::X86_64);
    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::RootfsNotFound);
}

TEST_CASE("rootfs item is found by path when no item has the rootfs ftype") {
    const char* json = R"JSON({
      "products": {
        "archlinux:current:amd64:default": {
          "versions": {
            "20260105_04:18": {
              "items": {
                "meta": {"ftype": "lxd.tar.xz", "sha256": "aa", "size": 1,
                         "path": "images/archlinux/current/amd64/default/20260105_04:18/lxd.tar.xz"},
                "rootfs": {"ftype": "squashfs", "sha256": "beef", "size": 10,
                           "path": "images/archlinux/current/amd64/default/20260105_04:18/rootfs.tar.xz"}
              }
            }
          }
        }
      }
    })JSON";

    FakeTransport transport;
    ImageIndexClient client(Mirror{}, transport);
    auto result = client.resolve_from_index(parse_or_fail(json), Distro::Arch, "current", Arch::X86_64);
    REQUIRE(result.ok);
    CHECK(result.image.sha256 == "beef");
    CHECK(result.image.filename == "rootfs.tar.xz");
}

TEST_CASE("malformed items are skipped") {
    const char* json = R"JSON({
      "products": {
        "alpine:3.21:amd64:default": {
          "versions": {
            "20260218_13:00": {
              "items": {
                "root.tar.xz": {"ftype": "root.tar.xz", "size": 1, "path": "images/a/rootfs.tar.xz"}
              }
            }
          }
        }
      }
    })JSON";

    auto parsed = parse_image_index(json);
    REQUIRE(parsed.ok);
    const auto& product = parsed.index.products.at("alpine:3.21:amd64:default");
    CHECK(product.versions.at("20260218_13:00").items.empty());

    FakeTransport transport;
    ImageIndexClient client(Mirror{}, transport);
    auto result = client.resolve_from_index(parsed.index, Distro::Alpine, "3.21", Arch::X86_64);
    CHECK(result.kind == ErrorKind::RootfsNotFound);
}

TEST_CASE("parse_image_index rejects invalid documents") {
    auto garbage = parse_image_index("{not json");
    CHECK_FALSE(garbage.ok);
    CHECK(garbage.kind == ErrorKind::MetadataDecode);

    auto no_products = parse_image_index(R"({"format": "products:1.0"})");
    CHECK_FALSE(no_products.ok);
    CHECK(no_products.kind == ErrorKind::MetadataDecode);
}

TEST_CASE("index fetch failures surface as transport errors") {
    FakeTransport transport;
    ImageIndexClient client(Mirror{}, transport);

    auto result = client.resolve(Distro::Alpine, "3.21", Arch::X86_64);
    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::Transport);
    CHECK(transport.count("https://images.linuxcontainers.org/streams/v1/images.json") == 1);
}
