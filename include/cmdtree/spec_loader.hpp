#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <unordered_map>

namespace cmdtree {

// ============================================================================
// Spec Loader (YAML with common-data include/merge)
// ============================================================================

/**
 * Loads declarative spec files. Two composition markers are resolved against
 * the common data of the file's own directory (COMMON_DATA_FILE). Given
 *
 *     foo:
 *       a: b
 *       c: d
 *     baz:
 *       - e: f
 *       - g: h
 *
 * a scalar include
 *
 *     bar: !COMMON foo.a            ->  bar: b
 *
 * a mapping merge
 *
 *     bar:                          ->  bar:
 *       _COMMON_: foo                     a: b
 *       i: j                              c: d
 *                                         i: j
 *
 * and a sequence merge
 *
 *     bar:                          ->  bar:
 *       - _COMMON_baz                     - e: f
 *       - i: j                            - g: h
 *                                         - i: j
 *
 * Merge values are comma separated lists of dotted attribute paths. Markers
 * are resolved at every depth, children first. Any unresolved reference
 * aborts the whole document with a LayoutError.
 */
class SpecLoader {
public:
    static constexpr const char* INCLUDE_TAG = "!COMMON";
    static constexpr const char* MERGE_KEY = "_COMMON_";

    // Load and compose a spec file.
    // Throws LoadFailure if the file cannot be read, LayoutError otherwise.
    nlohmann::json load(const std::string& path);

    // Common data for a directory, parsed once and cached.
    // Returns null when the directory has no common data file.
    const nlohmann::json& common_data_for(const std::string& directory);

    // Number of directories whose common data has been looked up
    size_t cached_directories() const { return common_cache_.size(); }

private:
    std::unordered_map<std::string, nlohmann::json> common_cache_;
};

// Parse YAML text with no markers active
nlohmann::json parse_yaml_plain(const std::string& text, const std::string& source_path);

// Parse YAML text and resolve markers against common_data (null = none)
nlohmann::json compose_document(const std::string& text,
                                const std::string& source_path,
                                const nlohmann::json& common_data);

// Look up a dotted attribute path in common_data.
// Throws LayoutError if the data is absent or any segment is missing or falsy.
nlohmann::json resolve_common_attribute(const nlohmann::json& common_data,
                                        const std::string& attribute_path,
                                        const std::string& source_path);

} // namespace cmdtree
