#pragma once

#include "cmdtree/artifact.hpp"
#include "cmdtree/loader.hpp"
#include "cmdtree/release_track.hpp"
#include "cmdtree/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace cmdtree {

// ============================================================================
// Command Tree
// ============================================================================

struct TreeNode {
    std::string name;
    TreePath path;
    std::string location;                // first implementation location
    std::vector<std::string> locations;  // every implementation location
    ArtifactPtr artifact;
    std::vector<TreeNode> groups;
    std::vector<TreeNode> commands;
};

// A node left out of the tree because it failed to load
struct NodeFailure {
    TreePath path;
    std::string kind;     // "load_failure" | "layout_error"
    std::string message;
};

struct TreeLoadOptions {
    std::string root_name = "cli";
    ReleaseTrack release_track = ReleaseTrack::GA;
    bool fail_fast = false;
};

struct TreeLoadResult {
    bool ok = false;
    std::string error;
    TreeNode root;
    std::vector<TreePath> skipped;       // no implementation for the track
    std::vector<NodeFailure> failures;   // degraded nodes
};

/**
 * Load the whole command tree rooted at root_dir for options.release_track.
 *
 * Nodes without an implementation for the track are skipped. A child that
 * fails with LoadFailure or LayoutError is recorded and left out while its
 * siblings keep loading, unless options.fail_fast is set. Failing to load
 * the root group fails the whole result.
 */
TreeLoadResult load_command_tree(const std::string& root_dir,
                                 const TreeLoadOptions& options,
                                 LoadSession& session);

/**
 * Load the single element at relative_path below the root without walking
 * the rest of the tree. Every group on the way is loaded for
 * options.release_track as well, so an element is only found where
 * load_command_tree would place it. The returned node has no children.
 *
 * Returns nullopt if nothing is discovered at that path.
 *
 * @throws LoadFailure, LayoutError, ReleaseTrackNotImplementedError
 */
std::optional<TreeNode> load_element(const std::string& root_dir,
                                     const TreePath& relative_path,
                                     const TreeLoadOptions& options,
                                     LoadSession& session);

// Node at a path relative to root (root itself for an empty path)
const TreeNode* find_node(const TreeNode& root, const TreePath& relative_path);

// {"name", "kind", "release_tracks", "groups", "commands"}
nlohmann::json tree_to_json(const TreeNode& node);

// Number of nodes including root
size_t count_nodes(const TreeNode& node);

} // namespace cmdtree
