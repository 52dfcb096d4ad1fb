#pragma once

#include "rootcache/distro.hpp"
#include "rootcache/mirror.hpp"
#include "rootcache/transport.hpp"
#include "rootcache/types.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>

namespace rootcache {

// ============================================================================
// Unified Image Index Document
// ============================================================================
//
// {
//   "products": {
//     "<distro>:<release>:<arch>:<variant>": {
//       "versions": {
//         "<build timestamp>": {
//           "items": { "<key>": {"ftype", "sha256", "size", "path"} }
//         }
//       }
//     }
//   }
// }

// Variants tried in order when looking up a product. Append new flavors at
// the end; resolution walks this list and takes the first present key.
inline const std::array<const char*, 2> VARIANT_PRIORITY = {"default", "cloud"};

// Item type tag of the root filesystem archive
inline const char* const ROOTFS_FTYPE = "root.tar.xz";

// Conventional rootfs filename, used when no item carries ROOTFS_FTYPE
inline const char* const ROOTFS_FILENAME = "rootfs.tar.xz";

struct IndexItem {
    std::string ftype;
    std::string sha256;
    uint64_t size = 0;
    std::string path;       // Relative to the mirror base URL
};

struct ProductBuild {
    std::map<std::string, IndexItem> items;
};

// Ordering key for build timestamps ("20260218_07:42"). The index uses a
// fixed-width, zero-padded format, so byte-wise comparison of the raw text is
// chronological. Comparing through this type keeps that assumption in one
// place.
class BuildTimestamp {
public:
    explicit BuildTimestamp(std::string raw) : raw_(std::move(raw)) {}

    const std::string& str() const { return raw_; }

    bool operator<(const BuildTimestamp& other) const { return raw_ < other.raw_; }
    bool operator==(const BuildTimestamp& other) const { return raw_ == other.raw_; }

private:
    std::string raw_;
};

struct Product {
    std::string arch;
    std::string os;
    std::string release;
    std::string release_title;
    std::string variant;
    std::map<std::string, ProductBuild> versions;   // Keyed by build timestamp
};

struct ImageIndex {
    std::unordered_map<std::string, Product> products;
};

struct IndexParseResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    ImageIndex index;
};

IndexParseResult parse_image_index(const std::string& json_str);

// ============================================================================
// Resolution
// ============================================================================

struct ResolvedImage {
    std::string url;
    std::string sha256;     // Lowercase hex
    uint64_t size = 0;
    std::string filename;
};

struct ResolveResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    ResolvedImage image;
    std::string product_key;    // Key that matched
    std::string build;          // Selected build timestamp
};

// "<index name>:<index release>:<index arch>:<variant>"
std::string product_key(Distro distro, const std::string& version, Arch arch,
                        const std::string& variant);

class ImageIndexClient {
public:
    ImageIndexClient(Mirror mirror, HttpTransport& transport)
        : mirror_(std::move(mirror)), transport_(transport) {}

    const Mirror& mirror() const { return mirror_; }

    // Download and parse the mirror's index document
    IndexParseResult fetch_index();

    // fetch_index() followed by resolve_from_index()
    ResolveResult resolve(Distro distro, const std::string& version, Arch arch);

    ResolveResult resolve_from_index(const ImageIndex& index,
                                     Distro distro,
                                     const std::string& version,
                                     Arch arch) const;

private:
    Mirror mirror_;
    HttpTransport& transport_;
};

} // namespace rootcache
