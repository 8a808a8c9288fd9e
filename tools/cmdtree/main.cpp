/**
 * cmdtree CLI - Entry Point
 *
 * Inspect a filesystem command tree: discovery, spec composition and
 * release-track resolution.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace cmdtree::cli::commands {
    void setup_tree(CLI::App* app, GlobalOptions& opts);
    void setup_ls(CLI::App* app, GlobalOptions& opts);
    void setup_render(CLI::App* app, GlobalOptions& opts);
    void setup_resolve(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace cmdtree::cli;

    CLI::App app{"cmdtree - command tree loader"};
    app.set_version_flag("-V,--version", CMDTREE_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "Command tree root directory");
    app.add_option("--config", opts.config, "Loader configuration file");
    app.add_option("--track", opts.track, "Release track (GA, BETA, ALPHA)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* tree_cmd = app.add_subcommand("tree", "Load and print the command tree");
    commands::setup_tree(tree_cmd, opts);

    auto* ls_cmd = app.add_subcommand("ls", "List sub groups and commands of a group");
    commands::setup_ls(ls_cmd, opts);

    auto* render_cmd = app.add_subcommand("render", "Compose a spec file with its common data");
    commands::setup_render(render_cmd, opts);

    auto* resolve_cmd = app.add_subcommand("resolve", "Load one element for a release track");
    commands::setup_resolve(resolve_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
