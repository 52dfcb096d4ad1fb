/**
 * rootcache CLI - distros command
 */

#include "../common.hpp"
#include <rootcache/provider.hpp>
#include <CLI/CLI.hpp>

namespace rootcache::cli::commands {

namespace {

int cmd_distros(const GlobalOptions& opts) {
    setup_logging(opts);

    nlohmann::json list = nlohmann::json::array();
    for (Distro d : all_distros()) {
        nlohmann::json j;
        j["name"] = distro_slug(d);
        j["index_name"] = distro_index_name(d);
        j["default_version"] = default_version(d);
        j["official"] = get_official_provider(d).has_value();
        list.push_back(j);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["distros"] = list;
        output_json(j);
        return 0;
    }

    for (const auto& d : list) {
        std::string name = d["name"].get<std::string>();
        std::string version = d["default_version"].get<std::string>();
        std::cout << "  " << name << std::string(name.size() < 12 ? 12 - name.size() : 1, ' ')
                  << version
                  << (d["official"].get<bool>() ? "  (official source)" : "") << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_distros(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_distros(opts));
    });
}

} // namespace rootcache::cli::commands
