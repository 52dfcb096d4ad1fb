/**
 * rootcache CLI - fetch command
 *
 * Ensure a rootfs archive is cached and verified, downloading on a miss.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace rootcache::cli::commands {

namespace {

struct FetchOptions {
    std::string target;
    std::string arch;
    bool official = false;
};

int cmd_fetch(const GlobalOptions& opts, const FetchOptions& fetch_opts) {
    setup_logging(opts);

    Target target;
    if (!parse_target(fetch_opts.target, fetch_opts.arch, opts, target)) {
        return 1;
    }

    auto manager = make_manager(opts);
    if (!manager) {
        return 1;
    }

    auto progress = make_progress_printer(opts);
    auto result = fetch_opts.official
        ? manager->ensure_official(target.distro, target.version, target.arch, progress)
        : manager->ensure(target.distro, target.version, target.arch, progress);

    if (!result.ok) {
        if (opts.json && result.kind == ErrorKind::ChecksumMismatch) {
            nlohmann::json j;
            j["ok"] = false;
            j["error"] = result.error;
            j["kind"] = error_kind_to_string(result.kind);
            j["expected"] = result.expected_hash;
            j["actual"] = result.actual_hash;
            output_json(j);
        } else {
            print_error(result.error, opts.json, result.kind);
        }
        return 1;
    }

    if (opts.json) {
        nlohmann::json j = cached_to_json(result.entry);
        j["ok"] = true;
        j["from_cache"] = result.from_cache;
        output_json(j);
    } else {
        std::cout << result.entry.archive_path << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_fetch(CLI::App* app, GlobalOptions& opts) {
    static FetchOptions fetch_opts;

    app->add_option("target", fetch_opts.target, "Distribution as name[:version]")->required();
    app->add_option("--arch", fetch_opts.arch, "Target architecture (default: host)");
    app->add_flag("--official", fetch_opts.official,
                  "Download from the distro's official source instead of the image index");

    app->callback([&opts]() {
        std::exit(cmd_fetch(opts, fetch_opts));
    });
}

} // namespace rootcache::cli::commands
