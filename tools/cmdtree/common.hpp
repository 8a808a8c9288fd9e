/**
 * cmdtree CLI - Common utilities and types
 */

#pragma once

#include <cmdtree/cmdtree.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace cmdtree::cli {

// Portable getenv that avoids MSVC warnings
inline std::string safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name) == 0 && buf != nullptr) {
        std::string result(buf);
        free(buf);
        return result;
    }
    return "";
#else
    const char* val = std::getenv(name);
    return val ? val : "";
#endif
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;              // --root
    std::string config;            // --config
    std::string track;             // --track
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Everything a command needs after option, environment and config merging.
 */
struct CliContext {
    LoaderConfig config;
    std::string root;
    ReleaseTrack track = ReleaseTrack::GA;
};

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

/**
 * Parse a track given as an id ("BETA") or a prefix ("beta", "ga").
 */
inline std::optional<ReleaseTrack> parse_track_option(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (auto track = parse_release_track_id(upper)) {
        return track;
    }
    return parse_release_track_prefix(text);
}

/**
 * Resolve the configuration file.
 * Priority: --config flag > CMDTREE_CONFIG env > none
 */
inline std::string resolve_config_path(const GlobalOptions& opts) {
    if (!opts.config.empty()) {
        return opts.config;
    }
    return safe_getenv("CMDTREE_CONFIG");
}

/**
 * Resolve the tree root directory.
 * Priority: --root flag > CMDTREE_ROOT env > config "root" > current directory
 */
inline std::string resolve_tree_root(const GlobalOptions& opts, const LoaderConfig& config) {
    if (!opts.root.empty()) {
        return opts.root;
    }
    std::string env_root = safe_getenv("CMDTREE_ROOT");
    if (!env_root.empty()) {
        return env_root;
    }
    if (!config.root.empty()) {
        return config.root;
    }
    return std::filesystem::current_path().string();
}

/**
 * Merge flags, environment and configuration; set up logging.
 * Returns nullopt after printing an error.
 */
inline std::optional<CliContext> build_context(const GlobalOptions& opts) {
    CliContext ctx;
    ctx.config = get_default_config();

    std::string config_path = resolve_config_path(opts);
    if (!config_path.empty()) {
        auto parsed = load_loader_config(config_path);
        if (!parsed.ok) {
            print_error("Invalid configuration " + config_path + ": " + parsed.error, opts.json);
            return std::nullopt;
        }
        for (const auto& warning : parsed.warnings) {
            spdlog::warn("{}: {}", config_path, warning);
        }
        ctx.config = parsed.config;
    }

    if (opts.verbose) {
        apply_log_level("debug");
    } else if (opts.quiet) {
        apply_log_level("error");
    } else {
        apply_log_level(ctx.config.log_level);
    }

    ctx.root = resolve_tree_root(opts, ctx.config);
    ctx.track = ctx.config.release_track;
    if (!opts.track.empty()) {
        auto track = parse_track_option(opts.track);
        if (!track) {
            print_error("Unknown release track: " + opts.track, opts.json);
            return std::nullopt;
        }
        ctx.track = *track;
    }
    return ctx;
}

/**
 * Catalog used by the CLI: everything registered in the global catalog,
 * plus an implicit group for package directories without a native
 * registration so declarative-only trees can be inspected.
 */
inline ModuleCatalog make_cli_catalog() {
    ModuleCatalog catalog = ModuleCatalog::global();
    catalog.set_fallback([](const ModuleRequest& request) -> std::vector<ArtifactPtr> {
        std::error_code ec;
        if (!std::filesystem::is_directory(request.location, ec)) {
            throw std::runtime_error("No native module registered for [" +
                                     normalize_module_path(request.path) + "]");
        }
        return {make_group(request.path.empty() ? std::string() : request.path.back())};
    });
    return catalog;
}

/**
 * Render a track set as a JSON array of ids.
 */
inline nlohmann::json tracks_to_json(const ReleaseTrackSet& tracks) {
    nlohmann::json arr = nlohmann::json::array();
    for (auto track : tracks) {
        arr.push_back(release_track_id(track));
    }
    return arr;
}

} // namespace cmdtree::cli
