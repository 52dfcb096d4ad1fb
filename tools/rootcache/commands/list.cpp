/**
 * rootcache CLI - list command
 *
 * List cached rootfs archives. Integrity is not re-verified.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace rootcache::cli::commands {

namespace {

int cmd_list(const GlobalOptions& opts) {
    setup_logging(opts);

    auto manager = make_manager(opts);
    if (!manager) {
        return 1;
    }

    auto result = manager->list_cached();
    if (!result.ok) {
        print_error(result.error, opts.json, result.kind);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["cache_dir"] = manager->cache_dir();
        j["entries"] = nlohmann::json::array();
        for (const auto& entry : result.entries) {
            j["entries"].push_back(cached_to_json(entry));
        }
        output_json(j);
        return 0;
    }

    if (result.entries.empty()) {
        std::cout << "No cached rootfs archives in " << manager->cache_dir() << "." << std::endl;
        return 0;
    }

    uint64_t total = 0;
    for (const auto& entry : result.entries) {
        const auto& m = entry.metadata;
        std::cout << "  " << m.distro << " " << m.version << " (" << m.arch << ")  "
                  << m.filename << "  " << format_bytes(m.size) << std::endl;
        total += m.size;
    }
    std::cout << result.entries.size() << " entries, " << format_bytes(total) << std::endl;
    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_list(opts));
    });
}

} // namespace rootcache::cli::commands
