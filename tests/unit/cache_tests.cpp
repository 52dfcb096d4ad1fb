#include <doctest/doctest.h>
#include <rootcache/cache.hpp>
#include <rootcache/platform.hpp>

#include "test_helpers.hpp"

#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

using namespace rootcache;

namespace {

DownloadResult make_download(const std::string& content, const std::string& filename) {
    DownloadResult result;
    result.ok = true;
    result.data = to_bytes(content);
    result.sha256 = sha256_of(result.data);
    result.filename = filename;
    return result;
}

std::string entry_path(const std::string& root, const std::string& distro,
                       const std::string& version, const std::string& arch) {
    return (fs::path(root) / distro / version / arch).string();
}

// Store an entry and pin its download timestamp
CachedRootfs make_entry(const std::string& root, const std::string& distro,
                        const std::string& version, const std::string& content,
                        const std::string& downloaded_at) {
    std::string dir = entry_path(root, distro, version, "x86_64");
    auto stored = store(dir, make_download(content, "rootfs.tar.xz"));
    REQUIRE(stored.ok);

    stored.entry.metadata.downloaded_at = downloaded_at;
    auto written = atomic_write_file(join_path(dir, METADATA_FILENAME),
                                     serialize_cache_metadata(stored.entry.metadata));
    REQUIRE(written.ok);
    return stored.entry;
}

} // namespace

// ============================================================================
// Store & lookup
// ============================================================================

TEST_CASE("store then load_cached round-trips the metadata") {
    TempDir tmp;
    std::string dir = entry_path(tmp.path(), "alpine", "3.21", "aarch64");
    auto download = make_download("fake rootfs data", "rootfs.tar.gz");

    auto stored = store(dir, download);
    REQUIRE(stored.ok);
    CHECK(stored.entry.metadata.sha256 == download.sha256);
    CHECK(stored.entry.metadata.filename == "rootfs.tar.gz");
    CHECK(fs::exists(stored.entry.archive_path));

    auto loaded = load_cached(dir);
    REQUIRE(loaded.ok);
    REQUIRE(loaded.entry.has_value());
    CHECK(loaded.entry->metadata.sha256 == download.sha256);
    CHECK(loaded.entry->metadata.filename == "rootfs.tar.gz");
    CHECK(loaded.entry->metadata.size == download.data.size());
}

TEST_CASE("store derives distro, version and arch from the entry path") {
    TempDir tmp;
    auto stored = store(entry_path(tmp.path(), "debian", "12", "x86_64") + "/",
                        make_download("x", "rootfs.tar.xz"));
    REQUIRE(stored.ok);
    CHECK(stored.entry.metadata.distro == "debian");
    CHECK(stored.entry.metadata.version == "12");
    CHECK(stored.entry.metadata.arch == "x86_64");
    CHECK(EpochSeconds(stored.entry.metadata.downloaded_at).valid());
}

TEST_CASE("metadata sidecar uses the documented field names") {
    TempDir tmp;
    std::string dir = entry_path(tmp.path(), "alpine", "3.21", "x86_64");
    REQUIRE(store(dir, make_download("abc", "rootfs.tar.xz")).ok);

    std::ifstream in(join_path(dir, METADATA_FILENAME));
    auto j = nlohmann::json::parse(in);
    CHECK(j["distro"] == "alpine");
    CHECK(j["version"] == "3.21");
    CHECK(j["arch"] == "x86_64");
    CHECK(j["filename"] == "rootfs.tar.xz");
    CHECK(j["size"] == 3);
    CHECK(j["sha256"].get<std::string>().size() == 64);
    CHECK(j["downloaded_at"].is_string());
}

TEST_CASE("corrupted archive is evicted and reported as not cached") {
    TempDir tmp;
    std::string dir = entry_path(tmp.path(), "alpine", "3.21", "aarch64");
    auto stored = store(dir, make_download("original data", "rootfs.tar.gz"));
    REQUIRE(stored.ok);

    {
        std::ofstream out(stored.entry.archive_path, std::ios::binary | std::ios::trunc);
        out << "corrupted data";
    }

    auto loaded = load_cached(dir);
    REQUIRE(loaded.ok);
    CHECK_FALSE(loaded.entry.has_value());
    CHECK_FALSE(fs::exists(dir));
}

TEST_CASE("missing metadata is not cached") {
    TempDir tmp;
    std::string dir = entry_path(tmp.path(), "alpine", "3.21", "x86_64");
    fs::create_directories(dir);

    auto loaded = load_cached(dir);
    REQUIRE(loaded.ok);
    CHECK_FALSE(loaded.entry.has_value());
}

TEST_CASE("missing archive is not cached") {
    TempDir tmp;
    std::string dir = entry_path(tmp.path(), "alpine", "3.21", "x86_64");
    auto stored = store(dir, make_download("data", "rootfs.tar.gz"));
    REQUIRE(stored.ok);
    fs::remove(stored.entry.archive_path);

    auto loaded = load_entry(dir);
    REQUIRE(loaded.ok);
    CHECK_FALSE(loaded.entry.has_value());
}

TEST_CASE("malformed metadata is a decode error") {
    TempDir tmp;
    std::string dir = entry_path(tmp.path(), "alpine", "3.21", "x86_64");
    fs::create_directories(dir);
    REQUIRE(atomic_write_file(join_path(dir, METADATA_FILENAME), std::string("{\"distro\": ")).ok);

    auto loaded = load_cached(dir);
    CHECK_FALSE(loaded.ok);
    CHECK(loaded.kind == ErrorKind::MetadataDecode);
}

TEST_CASE("parse_cache_metadata requires every field") {
    auto missing_size = parse_cache_metadata(
        R"({"distro":"a","version":"1","arch":"x86_64","sha256":"ab","filename":"f","downloaded_at":"1"})");
    CHECK_FALSE(missing_size.ok);
    CHECK(missing_size.kind == ErrorKind::MetadataDecode);
    CHECK(missing_size.error.find("size") != std::string::npos);
}

// ============================================================================
// Listing
// ============================================================================

TEST_CASE("list_all on an empty cache") {
    TempDir tmp;
    auto listed = list_all(tmp.path());
    REQUIRE(listed.ok);
    CHECK(listed.entries.empty());
}

TEST_CASE("list_all on a cache root that does not exist") {
    TempDir tmp;
    auto listed = list_all(join_path(tmp.path(), "never-created"));
    REQUIRE(listed.ok);
    CHECK(listed.entries.empty());
}

TEST_CASE("list_all walks distro, version and arch levels") {
    TempDir tmp;
    REQUIRE(store(entry_path(tmp.path(), "alpine", "3.21", "x86_64"), make_download("a", "rootfs.tar.xz")).ok);
    REQUIRE(store(entry_path(tmp.path(), "alpine", "3.21", "aarch64"), make_download("b", "rootfs.tar.xz")).ok);
    REQUIRE(store(entry_path(tmp.path(), "ubuntu", "24.04", "x86_64"), make_download("c", "rootfs.tar.xz")).ok);

    // Stray files and incomplete entries are ignored
    fs::create_directories(entry_path(tmp.path(), "debian", "12", "x86_64"));
    REQUIRE(atomic_write_file(join_path(tmp.path(), "README"), std::string("x")).ok);

    auto listed = list_all(tmp.path());
    REQUIRE(listed.ok);
    CHECK(listed.entries.size() == 3);
}

TEST_CASE("list_all does not verify integrity") {
    TempDir tmp;
    std::string dir = entry_path(tmp.path(), "alpine", "3.21", "x86_64");
    auto stored = store(dir, make_download("good", "rootfs.tar.xz"));
    REQUIRE(stored.ok);
    {
        std::ofstream out(stored.entry.archive_path, std::ios::binary | std::ios::trunc);
        out << "bad";
    }

    auto listed = list_all(tmp.path());
    REQUIRE(listed.ok);
    CHECK(listed.entries.size() == 1);
    CHECK(fs::exists(dir));
}

// ============================================================================
// Pruning
// ============================================================================

TEST_CASE("epoch seconds compare numerically") {
    CHECK(EpochSeconds("999") < EpochSeconds("1000"));
    CHECK(EpochSeconds("1760000000") < EpochSeconds("1760000001"));
    CHECK(EpochSeconds("garbage") < EpochSeconds("0"));
    CHECK_FALSE(EpochSeconds("").valid());
    CHECK(EpochSeconds("42") == EpochSeconds("42"));
}

TEST_CASE("prune keeps the newest entries per distro") {
    TempDir tmp;
    auto oldest = make_entry(tmp.path(), "alpine", "3.19", "aaaaa", "1000");
    auto middle = make_entry(tmp.path(), "alpine", "3.20", "bbbbbbb", "2000");
    auto newest = make_entry(tmp.path(), "alpine", "3.21", "ccc", "3000");
    auto other = make_entry(tmp.path(), "ubuntu", "24.04", "dd", "500");

    auto result = prune(tmp.path(), 1);
    REQUIRE(result.ok);
    CHECK(result.removed == 2);
    CHECK(result.freed_bytes == oldest.metadata.size + middle.metadata.size);

    CHECK_FALSE(fs::exists(oldest.entry_dir()));
    CHECK_FALSE(fs::exists(middle.entry_dir()));
    CHECK(fs::exists(newest.entry_dir()));
    CHECK(fs::exists(other.entry_dir()));
}

TEST_CASE("prune orders timestamps of different widths numerically") {
    TempDir tmp;
    auto short_ts = make_entry(tmp.path(), "alpine", "3.20", "old", "999");
    auto long_ts = make_entry(tmp.path(), "alpine", "3.21", "new", "1000");

    auto result = prune(tmp.path(), 1);
    REQUIRE(result.ok);
    CHECK_FALSE(fs::exists(short_ts.entry_dir()));
    CHECK(fs::exists(long_ts.entry_dir()));
}

TEST_CASE("prune does not count failed removals") {
    TempDir tmp;
    auto a = make_entry(tmp.path(), "alpine", "3.18", "1111", "100");
    auto b = make_entry(tmp.path(), "alpine", "3.19", "22222222", "200");
    auto c = make_entry(tmp.path(), "alpine", "3.20", "333", "300");
    auto d = make_entry(tmp.path(), "alpine", "3.21", "4", "400");

    std::string stuck = b.entry_dir();
    auto result = prune(tmp.path(), 2, [&stuck](const std::string& dir) {
        if (dir == stuck) return false;
        return remove_directory(dir);
    });

    REQUIRE(result.ok);
    CHECK(result.removed == 1);
    CHECK(result.failed == 1);
    CHECK(result.freed_bytes == a.metadata.size);
    CHECK(fs::exists(b.entry_dir()));
    CHECK(fs::exists(c.entry_dir()));
    CHECK(fs::exists(d.entry_dir()));

    // A later prune picks the entry up again
    auto retry = prune(tmp.path(), 2);
    REQUIRE(retry.ok);
    CHECK(retry.freed_bytes == b.metadata.size);
    CHECK_FALSE(fs::exists(b.entry_dir()));
}

TEST_CASE("prune with keep larger than the cache removes nothing") {
    TempDir tmp;
    make_entry(tmp.path(), "alpine", "3.21", "x", "1");

    auto result = prune(tmp.path(), 5);
    REQUIRE(result.ok);
    CHECK(result.removed == 0);
    CHECK(result.freed_bytes == 0);
}

TEST_CASE("extract_to rejects an unsupported archive name before touching the target") {
    TempDir tmp;
    std::string dir = entry_path(tmp.path(), "fedora", "41", "x86_64");
    auto stored = store(dir, make_download("raw disk", "Fedora-Cloud-Base-41-1.2.x86_64.raw.xz"));
    REQUIRE(stored.ok);

    std::string target = join_path(tmp.path(), "target");
    auto result = stored.entry.extract_to(target);
    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::UnsupportedArchiveFormat);
    CHECK_FALSE(fs::exists(target));
}
