/**
 * cmdtree CLI - resolve command
 *
 * Load a single element of the tree for a release track.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cmdtree::cli::commands {

namespace {

struct ResolveOptions {
    std::vector<std::string> segments;
};

int cmd_resolve(const GlobalOptions& opts, const ResolveOptions& resolve_opts) {
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

    TreePath path{options.root_name};
    path.insert(path.end(), resolve_opts.segments.begin(), resolve_opts.segments.end());

    try {
        auto node = load_element(ctx->root, resolve_opts.segments, options, session);
        if (!node) {
            print_error("No such group or command: " + join_path(path), opts.json);
            return 1;
        }
        const auto& artifact = node->artifact;

        if (opts.json) {
            nlohmann::json j;
            j["path"] = join_path(node->path);
            j["name"] = artifact->name();
            j["kind"] = artifact_kind_to_string(artifact->kind());
            j["release_tracks"] = tracks_to_json(artifact->valid_release_tracks());
            j["locations"] = node->locations;
            if (auto declarative = dynamic_cast<const DeclarativeCommand*>(artifact.get())) {
                j["data"] = declarative->data();
            }
            output_json(j);
        } else {
            std::cout << join_path(node->path) << std::endl;
            std::cout << "Kind: " << artifact_kind_to_string(artifact->kind()) << std::endl;
            auto tracks = artifact->valid_release_tracks();
            std::cout << "Release tracks: "
                      << (tracks.empty() ? std::string("(inherited)") : format_release_tracks(tracks))
                      << std::endl;
            for (const auto& location : node->locations) {
                std::cout << "Source: " << location << std::endl;
            }
        }
    } catch (const ReleaseTrackNotImplementedError& e) {
        print_error(e.what(), opts.json);
        return 2;
    } catch (const Error& e) {
        print_error(e.what(), opts.json);
        return 1;
    }

    return 0;
}

} // anonymous namespace

void setup_resolve(CLI::App* app, GlobalOptions& opts) {
    static ResolveOptions resolve_opts;

    app->add_option("path", resolve_opts.segments, "Element path below the root (e.g. compute instances create)");

    app->callback([&opts]() {
        std::exit(cmd_resolve(opts, resolve_opts));
    });
}

} // namespace cmdtree::cli::commands
