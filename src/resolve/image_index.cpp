#include "rootcache/image_index.hpp"
#include "rootcache/digest.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace rootcache {

namespace {

std::string get_string_or(const nlohmann::json& j, const char* key, const std::string& fallback = "") {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return fallback;
}

// Items missing a required field are skipped rather than failing the whole
// index; the catalog is large and shared by many distros.
bool parse_item(const nlohmann::json& j, IndexItem& out) {
    if (!j.is_object()) return false;
    if (!j.contains("ftype") || !j["ftype"].is_string()) return false;
    if (!j.contains("path") || !j["path"].is_string()) return false;
    if (!j.contains("sha256") || !j["sha256"].is_string()) return false;
    if (!j.contains("size") || !j["size"].is_number_unsigned()) return false;

    out.ftype = j["ftype"].get<std::string>();
    out.path = j["path"].get<std::string>();
    out.sha256 = normalize_hex(j["sha256"].get<std::string>());
    out.size = j["size"].get<uint64_t>();
    return true;
}

std::string filename_of(const std::string& path) {
    auto slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return name.empty() ? ROOTFS_FILENAME : name;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

IndexParseResult parse_image_index(const std::string& json_str) {
    IndexParseResult result;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object() || !j.contains("products") || !j["products"].is_object()) {
            result.kind = ErrorKind::MetadataDecode;
            result.error = "image index has no products object";
            return result;
        }

        for (const auto& [key, pj] : j["products"].items()) {
            if (!pj.is_object()) {
                continue;
            }

            Product product;
            product.arch = get_string_or(pj, "arch");
            product.os = get_string_or(pj, "os");
            product.release = get_string_or(pj, "release");
            product.release_title = get_string_or(pj, "release_title");
            product.variant = get_string_or(pj, "variant");

            if (pj.contains("versions") && pj["versions"].is_object()) {
                for (const auto& [build, vj] : pj["versions"].items()) {
                    ProductBuild product_build;
                    if (vj.is_object() && vj.contains("items") && vj["items"].is_object()) {
                        for (const auto& [item_key, ij] : vj["items"].items()) {
                            IndexItem item;
                            if (parse_item(ij, item)) {
                                product_build.items.emplace(item_key, std::move(item));
                            } else {
                                spdlog::debug("skipping malformed index item {} in {} {}",
                                              item_key, key, build);
                            }
                        }
                    }
                    product.versions.emplace(build, std::move(product_build));
                }
            }

            result.index.products.emplace(key, std::move(product));
        }
    } catch (const nlohmann::json::exception& e) {
        result.kind = ErrorKind::MetadataDecode;
        result.error = std::string("failed to parse image index: ") + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

std::string product_key(Distro distro, const std::string& version, Arch arch,
                        const std::string& variant) {
    return std::string(distro_index_name(distro)) + ":" + index_release(distro, version) +
           ":" + arch_index_name(arch) + ":" + variant;
}

IndexParseResult ImageIndexClient::fetch_index() {
    std::string url = mirror_.streams_url();
    spdlog::info("fetching image index from {} ({})", mirror_to_string(mirror_), url);

    auto fetched = transport_.fetch(url);
    if (!fetched.ok) {
        IndexParseResult result;
        result.kind = fetched.kind;
        result.error = fetched.error;
        return result;
    }

    auto parsed = parse_image_index(std::string(fetched.data.begin(), fetched.data.end()));
    if (parsed.ok) {
        spdlog::debug("index loaded: {} products", parsed.index.products.size());
    }
    return parsed;
}

ResolveResult ImageIndexClient::resolve(Distro distro, const std::string& version, Arch arch) {
    auto index = fetch_index();
    if (!index.ok) {
        ResolveResult result;
        result.kind = index.kind;
        result.error = index.error;
        return result;
    }
    return resolve_from_index(index.index, distro, version, arch);
}

ResolveResult ImageIndexClient::resolve_from_index(const ImageIndex& index,
                                                   Distro distro,
                                                   const std::string& version,
                                                   Arch arch) const {
    ResolveResult result;

    const Product* product = nullptr;
    for (const char* variant : VARIANT_PRIORITY) {
        std::string key = product_key(distro, version, arch, variant);
        auto it = index.products.find(key);
        if (it != index.products.end()) {
            product = &it->second;
            result.product_key = key;
            break;
        }
    }

    if (product == nullptr) {
        result.kind = ErrorKind::ProductNotFound;
        result.error = std::string("product not found: ") + distro_slug(distro) + " " +
                      version + " (" + arch_index_name(arch) + ")";
        return result;
    }

    spdlog::debug("found product {}", result.product_key);

    // Latest build wins
    const ProductBuild* latest = nullptr;
    std::optional<BuildTimestamp> latest_key;
    for (const auto& [build, data] : product->versions) {
        BuildTimestamp key(build);
        if (!latest_key || *latest_key < key) {
            latest_key = key;
            latest = &data;
        }
    }

    if (latest == nullptr) {
        result.kind = ErrorKind::RootfsNotFound;
        result.error = "rootfs not found in product: " + result.product_key;
        return result;
    }
    result.build = latest_key->str();

    const IndexItem* rootfs = nullptr;
    for (const auto& [item_key, item] : latest->items) {
        if (item.ftype == ROOTFS_FTYPE) {
            rootfs = &item;
            break;
        }
    }
    if (rootfs == nullptr) {
        for (const auto& [item_key, item] : latest->items) {
            if (ends_with(item.path, ROOTFS_FILENAME)) {
                rootfs = &item;
                break;
            }
        }
    }

    if (rootfs == nullptr) {
        result.kind = ErrorKind::RootfsNotFound;
        result.error = "rootfs not found in product: " + result.product_key;
        return result;
    }

    spdlog::debug("selected build {} item {}", result.build, rootfs->path);

    result.image.url = mirror_.image_url(rootfs->path);
    result.image.sha256 = rootfs->sha256;
    result.image.size = rootfs->size;
    result.image.filename = filename_of(rootfs->path);
    result.ok = true;
    return result;
}

} // namespace rootcache
