#pragma once

#include "cmdtree/release_track.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cmdtree {

// ============================================================================
// Loader Configuration
// ============================================================================

constexpr const char* CONFIG_SCHEMA = "cmdtree.config.v1";

struct LoaderConfig {
    std::string schema;                          // MUST be CONFIG_SCHEMA
    std::string root;                            // tree root directory
    std::string root_name = "cli";               // name of the root group
    ReleaseTrack release_track = ReleaseTrack::GA;
    bool fail_fast = false;
    std::string log_level = "info";              // debug|info|warn|error|off

    // Source path for diagnostics
    std::string source_path;
};

// Built-in defaults used when no configuration file is given
LoaderConfig get_default_config();

struct LoaderConfigParseResult {
    bool ok = false;
    std::string error;
    LoaderConfig config;
    std::vector<std::string> warnings;
};

// Parse a configuration from a JSON string
LoaderConfigParseResult parse_loader_config_full(const std::string& json_str,
                                                 const std::string& source_path = "");

// Read and parse a configuration file
LoaderConfigParseResult load_loader_config(const std::string& path);

// ============================================================================
// Logging
// ============================================================================

// True if name is one of debug|info|warn|error|off
bool is_valid_log_level(const std::string& name);

// Set the spdlog default level from a name; returns false for unknown names
bool apply_log_level(const std::string& name);

} // namespace cmdtree
