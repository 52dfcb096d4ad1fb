#include "rootcache/digest.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <openssl/evp.h>

namespace rootcache {

namespace {

constexpr size_t FILE_READ_CHUNK = 8192;

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

const EVP_MD* evp_for(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::Sha256: return EVP_sha256();
        case HashAlgorithm::Sha512: return EVP_sha512();
    }
    return nullptr;
}

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

} // namespace

struct Digester::Impl {
    EvpMdCtx ctx;
    std::string error;
};

Digester::Digester(HashAlgorithm algorithm) : impl_(std::make_unique<Impl>()) {
    if (!impl_->ctx) {
        impl_->error = "EVP_MD_CTX_new failed";
        return;
    }
    if (EVP_DigestInit_ex(impl_->ctx.get(), evp_for(algorithm), nullptr) != 1) {
        impl_->error = "EVP_DigestInit_ex failed";
    }
}

Digester::~Digester() = default;

bool Digester::update(const void* data, size_t len) {
    if (!impl_->error.empty()) {
        return false;
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data, len) != 1) {
        impl_->error = "EVP_DigestUpdate failed";
        return false;
    }
    return true;
}

DigestResult Digester::finish() {
    DigestResult result;

    if (!impl_->error.empty()) {
        result.error = impl_->error;
        return result;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(impl_->ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.hex_digest = bytes_to_hex(hash, hash_len);
    result.ok = true;
    return result;
}

DigestResult compute_digest(HashAlgorithm algorithm, const std::vector<uint8_t>& data) {
    Digester digester(algorithm);
    digester.update(data.data(), data.size());
    return digester.finish();
}

DigestResult compute_file_digest(HashAlgorithm algorithm, const std::string& file_path) {
    DigestResult result;

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + file_path;
        return result;
    }

    Digester digester(algorithm);

    char buffer[FILE_READ_CHUNK];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (!digester.update(buffer, static_cast<size_t>(file.gcount()))) {
            break;
        }
    }

    if (file.bad()) {
        result.error = "failed to read file: " + file_path;
        return result;
    }

    return digester.finish();
}

std::string normalize_hex(const std::string& hex) {
    std::string lowered = hex;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

} // namespace rootcache
