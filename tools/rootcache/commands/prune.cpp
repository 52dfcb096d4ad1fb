/**
 * rootcache CLI - prune command
 *
 * Keep the newest N cached archives per distribution and remove the rest.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace rootcache::cli::commands {

namespace {

struct PruneOptions {
    size_t keep = 1;
};

int cmd_prune(const GlobalOptions& opts, const PruneOptions& prune_opts) {
    setup_logging(opts);

    auto manager = make_manager(opts);
    if (!manager) {
        return 1;
    }

    auto result = manager->prune(prune_opts.keep);
    if (!result.ok) {
        print_error(result.error, opts.json, result.kind);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["freed_bytes"] = result.freed_bytes;
        j["removed"] = result.removed;
        j["failed"] = result.failed;
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << "Removed " << result.removed << " entries, freed "
                  << format_bytes(result.freed_bytes) << std::endl;
        if (result.failed > 0) {
            std::cerr << "Warning: " << result.failed << " entries could not be removed" << std::endl;
        }
    }
    return 0;
}

} // anonymous namespace

void setup_prune(CLI::App* app, GlobalOptions& opts) {
    static PruneOptions prune_opts;

    app->add_option("--keep", prune_opts.keep, "Entries to keep per distribution")
        ->default_val(1)
        ->check(CLI::NonNegativeNumber);

    app->callback([&opts]() {
        std::exit(cmd_prune(opts, prune_opts));
    });
}

} // namespace rootcache::cli::commands
