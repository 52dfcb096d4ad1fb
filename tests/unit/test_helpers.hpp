#pragma once

#include <rootcache/digest.hpp>
#include <rootcache/platform.hpp>
#include <rootcache/transport.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

// Temporary directory removed on destruction
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() / ("rootcache_test_" + rootcache::generate_uuid());
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

inline std::vector<uint8_t> to_bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

inline std::string sha256_of(const std::vector<uint8_t>& data) {
    return rootcache::compute_digest(rootcache::HashAlgorithm::Sha256, data).hex_digest;
}

inline std::string sha512_of(const std::vector<uint8_t>& data) {
    return rootcache::compute_digest(rootcache::HashAlgorithm::Sha512, data).hex_digest;
}

// Unified index with one rootfs item per build: {build -> (sha256, path)}
inline std::string make_index_json(
    const std::string& product_key,
    const std::vector<std::pair<std::string, std::pair<std::string, std::string>>>& builds,
    uint64_t size = 1024) {
    nlohmann::json versions = nlohmann::json::object();
    for (const auto& [build, item] : builds) {
        nlohmann::json entry;
        entry["ftype"] = "root.tar.xz";
        entry["sha256"] = item.first;
        entry["size"] = size;
        entry["path"] = item.second;
        versions[build]["items"]["root.tar.xz"] = entry;
    }

    nlohmann::json doc;
    doc["format"] = "products:1.0";
    doc["products"][product_key]["versions"] = versions;
    return doc.dump();
}

// In-memory transport: serves registered URLs, fails everything else like an
// HTTP 404.
class FakeTransport : public rootcache::HttpTransport {
public:
    void serve(const std::string& url, const std::string& body) {
        responses_[url] = std::vector<uint8_t>(body.begin(), body.end());
    }

    void serve(const std::string& url, const std::vector<uint8_t>& body) {
        responses_[url] = body;
    }

    rootcache::FetchResult fetch(const std::string& url) override {
        requests.push_back(url);
        return respond(url);
    }

    rootcache::FetchResult fetch_stream(const std::string& url,
                                        const rootcache::ProgressCallback& on_progress) override {
        requests.push_back(url);
        auto result = respond(url);
        if (result.ok && on_progress) {
            // Two chunks, the way a streaming transport reports
            uint64_t total = result.data.size();
            on_progress(total / 2, total);
            on_progress(total, total);
        }
        return result;
    }

    size_t count(const std::string& url) const {
        size_t n = 0;
        for (const auto& r : requests) {
            if (r == url) ++n;
        }
        return n;
    }

    std::vector<std::string> requests;

private:
    rootcache::FetchResult respond(const std::string& url) const {
        rootcache::FetchResult result;
        auto it = responses_.find(url);
        if (it == responses_.end()) {
            result.kind = rootcache::ErrorKind::Transport;
            result.error = "HTTP 404 for " + url;
            result.http_status = 404;
            return result;
        }
        result.data = it->second;
        result.http_status = 200;
        result.ok = true;
        return result;
    }

    std::map<std::string, std::vector<uint8_t>> responses_;
};
