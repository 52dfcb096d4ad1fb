/**
 * rootcache CLI - Entry Point
 *
 * Resolve, download, verify and cache Linux distribution root filesystems.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace rootcache::cli::commands {
    void setup_fetch(CLI::App* app, GlobalOptions& opts);
    void setup_resolve(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_prune(CLI::App* app, GlobalOptions& opts);
    void setup_extract(CLI::App* app, GlobalOptions& opts);
    void setup_distros(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace rootcache::cli;

    CLI::App app{"rootcache - distribution rootfs cache"};
    app.set_version_flag("-V,--version", ROOTCACHE_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--cache-dir", opts.cache_dir, "Cache root (default: $ROOTCACHE_DIR or XDG data dir)");
    app.add_option("--mirror", opts.mirror, "Image index mirror: official, tuna, ustc, bfsu or a URL");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Warnings and errors only");

    auto* fetch_cmd = app.add_subcommand("fetch", "Download and cache a rootfs");
    commands::setup_fetch(fetch_cmd, opts);

    auto* resolve_cmd = app.add_subcommand("resolve", "Show the download URL and checksum");
    commands::setup_resolve(resolve_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "List cached rootfs archives");
    commands::setup_list(list_cmd, opts);

    auto* prune_cmd = app.add_subcommand("prune", "Remove old cached archives");
    commands::setup_prune(prune_cmd, opts);

    auto* extract_cmd = app.add_subcommand("extract", "Unpack a cached rootfs");
    commands::setup_extract(extract_cmd, opts);

    auto* distros_cmd = app.add_subcommand("distros", "List supported distributions");
    commands::setup_distros(distros_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
