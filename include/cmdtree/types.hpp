#pragma once

#include <map>
#include <string>
#include <vector>

namespace cmdtree {

// ============================================================================
// Layout Constants
// ============================================================================

// Declarative command spec files
constexpr const char* SPEC_EXTENSION = ".yaml";

// Native module stubs; the implementation is registered in a ModuleCatalog
constexpr const char* MODULE_EXTENSION = ".impl";

// Marks a directory as a package (command group) and names its module stub
constexpr const char* PACKAGE_MARKER = "__init__.impl";

// Per-directory shared data for !COMMON includes and _COMMON_ merges
constexpr const char* COMMON_DATA_FILE = "__init__.yaml";

// ============================================================================
// Tree Path
// ============================================================================

// Name segments from the root of the command hierarchy to a node
using TreePath = std::vector<std::string>;

// "gcloud.compute.instances"
std::string join_path(const TreePath& path);

// Module identity for a path: dot-joined with '-' mapped to '_'
std::string normalize_module_path(const TreePath& path);

// Returns path with name appended
TreePath child_path(const TreePath& path, const std::string& name);

// ============================================================================
// Candidate Set
// ============================================================================

// Element name -> source locations that implement it. A command may be
// implemented both natively and declaratively (for different tracks), so a
// name can map to more than one location.
using CandidateSet = std::map<std::string, std::vector<std::string>>;

} // namespace cmdtree
