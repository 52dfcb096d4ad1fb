#include "rootcache/download.hpp"
#include "rootcache/digest.hpp"
#include "rootcache/image_index.hpp"
#include "rootcache/provider.hpp"

#include <spdlog/spdlog.h>

namespace rootcache {

namespace {

std::string filename_from_url(const std::string& url, const std::string& fallback) {
    auto slash = url.rfind('/');
    std::string name = slash == std::string::npos ? url : url.substr(slash + 1);
    return name.empty() ? fallback : name;
}

DownloadResult failure(ErrorKind kind, const std::string& error) {
    DownloadResult result;
    result.kind = kind;
    result.error = error;
    return result;
}

void apply_mismatch(DownloadResult& result, const VerifyResult& verify) {
    result.ok = false;
    result.kind = verify.kind;
    result.error = verify.error;
    result.expected_hash = verify.expected;
    result.actual_hash = verify.actual;
}

} // namespace

std::string DownloadResult::sha512() const {
    auto digest = compute_digest(HashAlgorithm::Sha512, data);
    return digest.ok ? digest.hex_digest : std::string();
}

VerifyResult verify_download(const DownloadResult& result,
                             const std::string& expected,
                             HashAlgorithm algorithm) {
    VerifyResult verify;
    verify.expected = normalize_hex(expected);

    switch (algorithm) {
        case HashAlgorithm::Sha256:
            verify.actual = result.sha256;
            break;
        case HashAlgorithm::Sha512:
            verify.actual = result.sha512();
            break;
    }

    if (verify.actual.empty()) {
        verify.kind = ErrorKind::Io;
        verify.error = std::string("failed to compute ") + hash_algorithm_to_string(algorithm) +
                       " digest";
        return verify;
    }

    if (verify.actual != verify.expected) {
        verify.kind = ErrorKind::ChecksumMismatch;
        verify.error = std::string(hash_algorithm_to_string(algorithm)) +
                      " mismatch: expected " + verify.expected + ", got " + verify.actual;
        return verify;
    }

    verify.ok = true;
    return verify;
}

DownloadResult download_url(HttpTransport& transport,
                            const std::string& url,
                            const ProgressCallback& on_progress) {
    auto fetched = transport.fetch_stream(url, on_progress);
    if (!fetched.ok) {
        return failure(fetched.kind == ErrorKind::None ? ErrorKind::Transport : fetched.kind,
                       fetched.error);
    }

    DownloadResult result;
    result.data = std::move(fetched.data);
    result.filename = filename_from_url(url, "rootfs.tar.gz");

    auto digest = compute_digest(HashAlgorithm::Sha256, result.data);
    if (!digest.ok) {
        return failure(ErrorKind::Io, digest.error);
    }
    result.sha256 = digest.hex_digest;

    spdlog::debug("downloaded {} ({} bytes, sha256 {})", url, result.data.size(), result.sha256);

    result.ok = true;
    return result;
}

DownloadResult download_from_index(HttpTransport& transport,
                                   Distro distro,
                                   const std::string& version,
                                   Arch arch,
                                   const Mirror& mirror,
                                   const ProgressCallback& on_progress) {
    ImageIndexClient client(mirror, transport);
    auto resolved = client.resolve(distro, version, arch);
    if (!resolved.ok) {
        return failure(resolved.kind, resolved.error);
    }

    spdlog::info("downloading {} {} ({}) from {}: {}", distro_slug(distro), version,
                 arch_kernel_name(arch), mirror_to_string(mirror), resolved.image.url);

    auto result = download_url(transport, resolved.image.url, on_progress);
    if (!result.ok) {
        return result;
    }
    result.filename = resolved.image.filename;

    auto verify = verify_download(result, resolved.image.sha256, HashAlgorithm::Sha256);
    if (!verify.ok) {
        apply_mismatch(result, verify);
        return result;
    }

    spdlog::info("sha256 checksum verified");
    return result;
}

DownloadResult download_official(HttpTransport& transport,
                                 Distro distro,
                                 const std::string& version,
                                 Arch arch,
                                 const ProgressCallback& on_progress) {
    auto provider = get_official_provider(distro);
    if (!provider) {
        return failure(ErrorKind::UnsupportedDistro,
                       std::string("no official provider for ") + distro_slug(distro));
    }

    std::string url = provider->rootfs_url(version, arch);
    spdlog::info("downloading {} {} ({}) from official source: {}", distro_slug(distro),
                 version, arch_kernel_name(arch), url);

    return download_url(transport, url, on_progress);
}

DownloadResult download_official_verified(HttpTransport& transport,
                                          Distro distro,
                                          const std::string& version,
                                          Arch arch,
                                          const ProgressCallback& on_progress) {
    auto provider = get_official_provider(distro);
    if (!provider) {
        return failure(ErrorKind::UnsupportedDistro,
                       std::string("no official provider for ") + distro_slug(distro));
    }

    auto result = download_official(transport, distro, version, arch, on_progress);
    if (!result.ok) {
        return result;
    }

    auto checksum_url = provider->checksum_url(version, arch);
    if (!checksum_url) {
        spdlog::warn("{} publishes no checksum file, skipping verification", distro_slug(distro));
        return result;
    }

    spdlog::info("fetching checksum {}", *checksum_url);
    auto checksum_file = transport.fetch(*checksum_url);
    if (!checksum_file.ok) {
        return failure(checksum_file.kind == ErrorKind::None ? ErrorKind::Transport
                                                             : checksum_file.kind,
                       checksum_file.error);
    }

    std::string content(checksum_file.data.begin(), checksum_file.data.end());
    auto expected = provider->parse_checksum(content, result.filename);
    if (!expected.ok) {
        return failure(expected.kind, expected.error + " (" + *checksum_url + ")");
    }

    auto algorithm = provider->hash_algorithm();
    auto verify = verify_download(result, expected.hash, algorithm);
    if (!verify.ok) {
        apply_mismatch(result, verify);
        return result;
    }

    spdlog::info("{} checksum verified", hash_algorithm_to_string(algorithm));
    return result;
}

} // namespace rootcache
