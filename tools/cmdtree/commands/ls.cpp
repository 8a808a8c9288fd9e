/**
 * cmdtree CLI - ls command
 *
 * List the sub groups and commands discovered under a group directory.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cmdtree::cli::commands {

namespace {

struct LsOptions {
    std::vector<std::string> segments;
};

nlohmann::json candidates_to_json(const CandidateSet& set) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, locations] : set) {
        j[name] = locations;
    }
    return j;
}

void print_candidates(const char* title, const CandidateSet& set) {
    std::cout << title << ":" << std::endl;
    if (set.empty()) {
        std::cout << "  (none)" << std::endl;
    }
    for (const auto& [name, locations] : set) {
        std::cout << "  " << name << std::endl;
        for (const auto& location : locations) {
            std::cout << "    " << location << std::endl;
        }
    }
}

int cmd_ls(const GlobalOptions& opts, const LsOptions& ls_opts) {
    auto ctx = build_context(opts);
    if (!ctx) {
        return 1;
    }

    std::filesystem::path dir(ctx->root);
    TreePath path{ctx->config.root_name};
    for (const auto& segment : ls_opts.segments) {
        dir /= segment;
        path.push_back(segment);
    }

    try {
        auto subs = find_sub_elements({dir.string()}, path);

        if (opts.json) {
            nlohmann::json j;
            j["path"] = join_path(path);
            j["location"] = dir.string();
            j["groups"] = candidates_to_json(subs.groups);
            j["commands"] = candidates_to_json(subs.commands);
            output_json(j);
        } else {
            std::cout << join_path(path) << " (" << dir.string() << ")" << std::endl;
            print_candidates("Groups", subs.groups);
            print_candidates("Commands", subs.commands);
        }
    } catch (const Error& e) {
        print_error(e.what(), opts.json);
        return 1;
    }

    return 0;
}

} // anonymous namespace

void setup_ls(CLI::App* app, GlobalOptions& opts) {
    static LsOptions ls_opts;

    app->add_option("path", ls_opts.segments, "Group path below the root (e.g. compute instances)");

    app->callback([&opts]() {
        std::exit(cmd_ls(opts, ls_opts));
    });
}

} // namespace cmdtree::cli::commands
