/**
 * cmdtree CLI - tree command
 *
 * Load the whole command tree for a release track and print it.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cmdtree::cli::commands {

namespace {

struct TreeOptions {
    bool fail_fast = false;
};

void print_node(const TreeNode& node, int depth) {
    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    std::cout << indent << node.name;
    if (node.artifact) {
        bool is_group = node.artifact->kind() == ArtifactKind::Group;
        std::cout << (is_group ? "/" : "");
        auto tracks = node.artifact->valid_release_tracks();
        if (!tracks.empty()) {
            std::cout << "  [" << format_release_tracks(tracks) << "]";
        }
    }
    std::cout << std::endl;

    for (const auto& group : node.groups) {
        print_node(group, depth + 1);
    }
    for (const auto& command : node.commands) {
        print_node(command, depth + 1);
    }
}

int cmd_tree(const GlobalOptions& opts, const TreeOptions& tree_opts) {
    auto ctx = build_context(opts);
    if (!ctx) {
        return 1;
    }

    ModuleCatalog catalog = make_cli_catalog();
    PassthroughTranslator translator;
    LoadSession session(make_construction_id(), catalog, &translator);

    TreeLoadOptions options;
    options.root_name = ctx->config.root_name;
    options.release_track = ctx->track;
    options.fail_fast = ctx->config.fail_fast || tree_opts.fail_fast;

    spdlog::info("Loading {} from {} ({})", options.root_name, ctx->root,
                 release_track_id(options.release_track));

    auto result = load_command_tree(ctx->root, options, session);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        j["release_track"] = release_track_id(options.release_track);
        if (!result.ok) {
            j["error"] = result.error;
        }
        j["root"] = tree_to_json(result.root);
        j["skipped"] = nlohmann::json::array();
        for (const auto& path : result.skipped) {
            j["skipped"].push_back(join_path(path));
        }
        j["failures"] = nlohmann::json::array();
        for (const auto& failure : result.failures) {
            j["failures"].push_back({{"path", join_path(failure.path)},
                                     {"kind", failure.kind},
                                     {"message", failure.message}});
        }
        output_json(j);
        return result.ok ? 0 : 1;
    }

    if (!result.ok) {
        print_error(result.error, false);
        return 1;
    }

    print_node(result.root, 0);

    if (!opts.quiet) {
        std::cout << std::endl << count_nodes(result.root) << " element(s) loaded";
        if (!result.skipped.empty()) {
            std::cout << ", " << result.skipped.size() << " not in "
                      << release_track_id(options.release_track);
        }
        std::cout << std::endl;
        for (const auto& failure : result.failures) {
            std::cerr << "Failed: " << join_path(failure.path) << " (" << failure.kind
                      << "): " << failure.message << std::endl;
        }
    }
    return 0;
}

} // anonymous namespace

void setup_tree(CLI::App* app, GlobalOptions& opts) {
    static TreeOptions tree_opts;

    app->add_flag("--fail-fast", tree_opts.fail_fast, "Stop at the first element that fails to load");

    app->callback([&opts]() {
        std::exit(cmd_tree(opts, tree_opts));
    });
}

} // namespace cmdtree::cli::commands
