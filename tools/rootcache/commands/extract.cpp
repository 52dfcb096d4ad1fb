/**
 * rootcache CLI - extract command
 *
 * Unpack a cached rootfs into a directory. The entry must already be cached;
 * it is verified before extraction.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace rootcache::cli::commands {

namespace {

struct ExtractOptions {
    std::string target;
    std::string dest;
    std::string arch;
};

int cmd_extract(const GlobalOptions& opts, const ExtractOptions& extract_opts) {
    setup_logging(opts);

    Target target;
    if (!parse_target(extract_opts.target, extract_opts.arch, opts, target)) {
        return 1;
    }

    auto manager = make_manager(opts);
    if (!manager) {
        return 1;
    }

    auto lookup = manager->lookup(target.distro, target.version, target.arch);
    if (!lookup.ok) {
        print_error(lookup.error, opts.json, lookup.kind);
        return 1;
    }
    if (!lookup.entry) {
        print_error(std::string("not cached: ") + distro_slug(target.distro) + " " +
                        target.version + " (" + arch_kernel_name(target.arch) +
                        "); run 'rootcache fetch' first",
                    opts.json);
        return 1;
    }

    auto result = lookup.entry->extract_to(extract_opts.dest);
    if (!result.ok) {
        print_error(result.error, opts.json, result.kind);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["archive"] = lookup.entry->archive_path;
        j["target"] = extract_opts.dest;
        j["entries"] = result.entries;
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << "Extracted " << result.entries << " entries to " << extract_opts.dest << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_extract(CLI::App* app, GlobalOptions& opts) {
    static ExtractOptions extract_opts;

    app->add_option("target", extract_opts.target, "Distribution as name[:version]")->required();
    app->add_option("dest", extract_opts.dest, "Directory to extract into")->required();
    app->add_option("--arch", extract_opts.arch, "Target architecture (default: host)");

    app->callback([&opts]() {
        std::exit(cmd_extract(opts, extract_opts));
    });
}

} // namespace rootcache::cli::commands
