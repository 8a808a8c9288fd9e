/**
 * cmdtree CLI - render command
 *
 * Print a spec file after common-data includes and merges are applied.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cmdtree::cli::commands {

namespace {

struct RenderOptions {
    std::string file;
    bool plain = false;
};

int cmd_render(const GlobalOptions& opts, const RenderOptions& render_opts) {
    auto ctx = build_context(opts);
    if (!ctx) {
        return 1;
    }

    try {
        SpecLoader loader;
        nlohmann::json document = loader.load(render_opts.file);

        if (render_opts.plain) {
            std::cout << document.dump(2) << std::endl;
            return 0;
        }

        nlohmann::json j;
        j["ok"] = true;
        j["file"] = render_opts.file;
        j["document"] = document;
        output_json(j);
    } catch (const Error& e) {
        print_error(e.what(), opts.json);
        return 1;
    }

    return 0;
}

} // anonymous namespace

void setup_render(CLI::App* app, GlobalOptions& opts) {
    static RenderOptions render_opts;

    app->add_option("file", render_opts.file, "Spec file to render")->required();
    app->add_flag("--plain", render_opts.plain, "Print only the composed document");

    app->callback([&opts]() {
        std::exit(cmd_render(opts, render_opts));
    });
}

} // namespace cmdtree::cli::commands
