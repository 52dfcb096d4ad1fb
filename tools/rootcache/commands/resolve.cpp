/**
 * rootcache CLI - resolve command
 *
 * Show where a rootfs would be downloaded from, without downloading it.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace rootcache::cli::commands {

namespace {

struct ResolveOptions {
    std::string target;
    std::string arch;
    bool official = false;
};

int resolve_official(const GlobalOptions& opts, RootfsManager& manager, const Target& target) {
    auto result = manager.resolve_official(target.distro, target.version, target.arch);
    if (!result.ok) {
        print_error(result.error, opts.json, result.kind);
        return 1;
    }

    const auto& source = result.source;
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["url"] = source.url;
        j["checksum_url"] = source.checksum_url ? nlohmann::json(*source.checksum_url) : nlohmann::json();
        j["hash_algorithm"] = hash_algorithm_to_string(source.hash_algorithm);
        output_json(j);
    } else {
        std::cout << "url:       " << source.url << std::endl;
        std::cout << "checksum:  " << (source.checksum_url ? *source.checksum_url : "(none)")
                  << " [" << hash_algorithm_to_string(source.hash_algorithm) << "]" << std::endl;
    }
    return 0;
}

int cmd_resolve(const GlobalOptions& opts, const ResolveOptions& resolve_opts) {
    setup_logging(opts);

    Target target;
    if (!parse_target(resolve_opts.target, resolve_opts.arch, opts, target)) {
        return 1;
    }

    auto manager = make_manager(opts);
    if (!manager) {
        return 1;
    }

    if (resolve_opts.official) {
        return resolve_official(opts, *manager, target);
    }

    auto result = manager->resolve(target.distro, target.version, target.arch);
    if (!result.ok) {
        print_error(result.error, opts.json, result.kind);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["product"] = result.product_key;
        j["build"] = result.build;
        j["url"] = result.image.url;
        j["sha256"] = result.image.sha256;
        j["size"] = result.image.size;
        j["filename"] = result.image.filename;
        output_json(j);
    } else {
        std::cout << "product:   " << result.product_key << std::endl;
        std::cout << "build:     " << result.build << std::endl;
        std::cout << "url:       " << result.image.url << std::endl;
        std::cout << "sha256:    " << result.image.sha256 << std::endl;
        std::cout << "size:      " << format_bytes(result.image.size) << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_resolve(CLI::App* app, GlobalOptions& opts) {
    static ResolveOptions resolve_opts;

    app->add_option("target", resolve_opts.target, "Distribution as name[:version]")->required();
    app->add_option("--arch", resolve_opts.arch, "Target architecture (default: host)");
    app->add_flag("--official", resolve_opts.official, "Resolve the distro's official source");

    app->callback([&opts]() {
        std::exit(cmd_resolve(opts, resolve_opts));
    });
}

} // namespace rootcache::cli::commands
