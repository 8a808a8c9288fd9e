#pragma once

#include "cmdtree/types.hpp"

#include <string>
#include <vector>

namespace cmdtree {

// ============================================================================
// Sub-Element Discovery
// ============================================================================

struct SubElements {
    CandidateSet groups;    // package directories
    CandidateSet commands;  // native module stubs and spec files
};

/**
 * Find the sub groups and commands of the group implemented at impl_paths.
 *
 * Groups cannot be split across files, so impl_paths must hold exactly one
 * location (the group directory). Entries whose names start with '_' or '.'
 * are private and skipped. A group with no directory on disk has no
 * children.
 *
 * @throws LoadFailure  impl_paths holds more than one location
 * @throws LayoutError  a discovered name contains an uppercase character
 */
SubElements find_sub_elements(const std::vector<std::string>& impl_paths,
                              const TreePath& path);

// True if the location is a declarative spec file (by extension)
bool is_spec_file(const std::string& location);

// Element name for a directory entry: strips the spec or module extension
std::string element_name_for_entry(const std::string& entry_name);

} // namespace cmdtree
