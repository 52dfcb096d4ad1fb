#include <doctest/doctest.h>
#include <rootcache/platform.hpp>

#include "test_helpers.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

using namespace rootcache;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("atomic_write_file writes and replaces content") {
    TempDir tmp;
    std::string path = join_path(tmp.path(), "metadata.json");

    auto first = atomic_write_file(path, std::string("{\"a\": 1}"));
    REQUIRE(first.ok);
    CHECK(read_file(path) == "{\"a\": 1}");

    auto second = atomic_write_file(path, std::vector<uint8_t>{'x', 'y'});
    REQUIRE(second.ok);
    CHECK(read_file(path) == "xy");

    // No temp files left behind
    size_t count = 0;
    for (const auto& entry : fs::directory_iterator(tmp.path())) {
        (void)entry;
        ++count;
    }
    CHECK(count == 1);
}

TEST_CASE("atomic_write_file fails for a missing directory") {
    TempDir tmp;
    auto result = atomic_write_file(join_path(tmp.path(), "missing/file"), std::string("x"));
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}

TEST_CASE("get_epoch_seconds is a decimal number") {
    auto now = get_epoch_seconds();
    REQUIRE_FALSE(now.empty());
    for (char c : now) {
        CHECK((c >= '0' && c <= '9'));
    }
    CHECK(now.size() >= 10);
}

TEST_CASE("generate_uuid produces distinct v4 ids") {
    auto a = generate_uuid();
    auto b = generate_uuid();
    CHECK(a.size() == 36);
    CHECK(a[14] == '4');
    CHECK(a != b);
}

TEST_CASE("get_env reads the environment") {
    setenv("ROOTCACHE_TEST_VAR", "value", 1);
    CHECK(get_env("ROOTCACHE_TEST_VAR") == std::optional<std::string>("value"));
    unsetenv("ROOTCACHE_TEST_VAR");
    CHECK_FALSE(get_env("ROOTCACHE_TEST_VAR").has_value());
}
