#include <doctest/doctest.h>
#include <rootcache/mirror.hpp>

using namespace rootcache;

TEST_CASE("official mirror urls") {
    Mirror m;
    CHECK(m.base_url() == "https://images.linuxcontainers.org");
    CHECK(m.streams_url() == "https://images.linuxcontainers.org/streams/v1/images.json");
    CHECK(m.image_url("images/alpine/3.21/amd64/default/20260218_13:00/rootfs.tar.xz") ==
          "https://images.linuxcontainers.org/images/alpine/3.21/amd64/default/20260218_13:00/rootfs.tar.xz");
}

TEST_CASE("preset mirrors") {
    const auto& presets = mirror_presets();
    REQUIRE(presets.size() == 4);
    CHECK(presets[1].base_url() == "https://mirrors.tuna.tsinghua.edu.cn/lxc-images");
    CHECK(presets[2].base_url() == "https://mirrors.ustc.edu.cn/lxc-images");
    CHECK(presets[3].base_url() == "https://mirrors.bfsu.edu.cn/lxc-images");
}

TEST_CASE("custom mirror trims trailing slashes") {
    auto m = Mirror::custom("https://lxc.example.org/images//");
    CHECK(m.base_url() == "https://lxc.example.org/images");
    CHECK(m.streams_url() == "https://lxc.example.org/images/streams/v1/images.json");
    CHECK(mirror_to_string(m) == "custom(https://lxc.example.org/images//)");
}

TEST_CASE("parse_mirror accepts preset names and urls") {
    auto tuna = parse_mirror("TUNA");
    REQUIRE(tuna.ok);
    CHECK(tuna.mirror.kind == MirrorKind::Tuna);

    auto custom = parse_mirror("http://10.0.0.5/lxc");
    REQUIRE(custom.ok);
    CHECK(custom.mirror.kind == MirrorKind::Custom);
    CHECK(custom.mirror.base_url() == "http://10.0.0.5/lxc");

    auto bad = parse_mirror("ftp.example.org");
    CHECK_FALSE(bad.ok);
    CHECK(bad.error.find("ftp.example.org") != std::string::npos);
}
