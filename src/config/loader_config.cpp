#include "cmdtree/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace cmdtree {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    std::string level = to_lower(name);
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

} // namespace

LoaderConfig get_default_config() {
    LoaderConfig config;
    config.schema = CONFIG_SCHEMA;
    config.root_name = "cli";
    config.release_track = ReleaseTrack::GA;
    config.fail_fast = false;
    config.log_level = "info";
    return config;
}

LoaderConfigParseResult parse_loader_config_full(const std::string& json_str,
                                                 const std::string& source_path) {
    LoaderConfigParseResult result;
    result.config = get_default_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != CONFIG_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
            return result;
        }

        if (auto root = get_string(j, "root")) {
            result.config.root = *root;
        }

        if (auto root_name = get_string(j, "root_name")) {
            if (root_name->empty()) {
                result.warnings.push_back("invalid_configuration:empty_root_name");
            } else {
                result.config.root_name = *root_name;
            }
        }

        if (auto track = get_string(j, "release_track")) {
            auto parsed = parse_release_track_id(*track);
            if (parsed) {
                result.config.release_track = *parsed;
            } else {
                result.warnings.push_back("invalid_configuration:invalid_release_track:" + *track);
            }
        }

        if (j.contains("fail_fast")) {
            if (j["fail_fast"].is_boolean()) {
                result.config.fail_fast = j["fail_fast"].get<bool>();
            } else {
                result.warnings.push_back("invalid_configuration:invalid_fail_fast");
            }
        }

        if (auto level = get_string(j, "log_level")) {
            if (is_valid_log_level(*level)) {
                result.config.log_level = to_lower(*level);
            } else {
                result.warnings.push_back("invalid_configuration:invalid_log_level:" + *level);
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

LoaderConfigParseResult load_loader_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        LoaderConfigParseResult result;
        result.config = get_default_config();
        result.error = "cannot read " + path;
        return result;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse_loader_config_full(ss.str(), path);
}

bool is_valid_log_level(const std::string& name) {
    return parse_log_level(name).has_value();
}

bool apply_log_level(const std::string& name) {
    auto level = parse_log_level(name);
    if (!level) {
        return false;
    }
    spdlog::set_level(*level);
    return true;
}

} // namespace cmdtree
