#include <doctest/doctest.h>
#include <rootcache/digest.hpp>
#include <rootcache/platform.hpp>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace rootcache;

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST_CASE("sha256 known answers") {
    auto empty = compute_digest(HashAlgorithm::Sha256, {});
    REQUIRE(empty.ok);
    CHECK(empty.hex_digest == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    auto hello = compute_digest(HashAlgorithm::Sha256, bytes("hello"));
    REQUIRE(hello.ok);
    CHECK(hello.hex_digest == "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
}

TEST_CASE("sha512 known answer") {
    auto abc = compute_digest(HashAlgorithm::Sha512, bytes("abc"));
    REQUIRE(abc.ok);
    CHECK(abc.hex_digest ==
          "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
          "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
}

TEST_CASE("incremental updates equal a one-shot digest") {
    Digester digester(HashAlgorithm::Sha256);
    CHECK(digester.update("hel", 3));
    CHECK(digester.update("lo", 2));
    auto result = digester.finish();
    REQUIRE(result.ok);
    CHECK(result.hex_digest == compute_digest(HashAlgorithm::Sha256, bytes("hello")).hex_digest);
}

TEST_CASE("file digest streams content larger than the read buffer") {
    fs::path path = fs::temp_directory_path() / ("rootcache_digest_" + generate_uuid());
    std::string content(20000, 'x');
    {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    auto from_file = compute_file_digest(HashAlgorithm::Sha256, path.string());
    REQUIRE(from_file.ok);
    CHECK(from_file.hex_digest == compute_digest(HashAlgorithm::Sha256, bytes(content)).hex_digest);

    std::error_code ec;
    fs::remove(path, ec);
}

TEST_CASE("file digest reports a missing file") {
    auto result = compute_file_digest(HashAlgorithm::Sha256, "/nonexistent/rootcache/archive.tar.xz");
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("failed to open") != std::string::npos);
}

TEST_CASE("normalize_hex lowercases") {
    CHECK(normalize_hex("ABCdef01") == "abcdef01");
}
