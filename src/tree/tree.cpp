#include "cmdtree/tree.hpp"
#include "cmdtree/discovery.hpp"
#include "cmdtree/errors.hpp"

#include <optional>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace cmdtree {

namespace {

// Unwinds the whole walk in fail_fast mode; deliberately not a cmdtree::Error
// so the per-node handlers let it through.
struct WalkAborted : std::runtime_error {
    explicit WalkAborted(const std::string& message) : std::runtime_error(message) {}
};

class TreeBuilder {
public:
    TreeBuilder(const TreeLoadOptions& options, LoadSession& session, TreeLoadResult& result)
        : options_(options), session_(session), result_(result) {}

    void load_children(TreeNode& group) {
        SubElements subs = find_sub_elements({group.location}, group.path);

        for (const auto& [name, locations] : subs.groups) {
            if (auto node = load_node(name, locations, group.path, false)) {
                group.groups.push_back(std::move(*node));
            }
        }
        for (const auto& [name, locations] : subs.commands) {
            if (auto node = load_node(name, locations, group.path, true)) {
                group.commands.push_back(std::move(*node));
            }
        }
    }

private:
    std::optional<TreeNode> load_node(const std::string& name,
                                      const std::vector<std::string>& locations,
                                      const TreePath& parent_path,
                                      bool is_command) {
        TreePath path = child_path(parent_path, name);
        try {
            TreeNode node;
            node.name = name;
            node.path = path;
            node.location = locations.front();
            node.locations = locations;
            node.artifact = load_common_type(locations, path, options_.release_track,
                                             session_, is_command);
            if (!is_command) {
                load_children(node);
            }
            return node;
        } catch (const ReleaseTrackNotImplementedError& e) {
            spdlog::debug("Skipping {}: {}", join_path(path), e.what());
            result_.skipped.push_back(path);
        } catch (const LoadFailure& e) {
            record_failure(path, "load_failure", e.what());
        } catch (const LayoutError& e) {
            record_failure(path, "layout_error", e.what());
        }
        return std::nullopt;
    }

    void record_failure(const TreePath& path, const std::string& kind, const std::string& message) {
        spdlog::warn("Skipping {}: {}", join_path(path), message);
        result_.failures.push_back({path, kind, message});
        if (options_.fail_fast) {
            throw WalkAborted(message);
        }
    }

    const TreeLoadOptions& options_;
    LoadSession& session_;
    TreeLoadResult& result_;
};

} // namespace

TreeLoadResult load_command_tree(const std::string& root_dir,
                                 const TreeLoadOptions& options,
                                 LoadSession& session) {
    TreeLoadResult result;
    result.root.name = options.root_name;
    result.root.path = {options.root_name};
    result.root.location = root_dir;
    result.root.locations = {root_dir};

    spdlog::debug("Loading command tree {} from {} for track {}",
                  options.root_name, root_dir, release_track_id(options.release_track));

    TreeBuilder builder(options, session, result);
    try {
        result.root.artifact = load_common_type({root_dir}, result.root.path,
                                                options.release_track, session, false);
        builder.load_children(result.root);
    } catch (const WalkAborted& e) {
        result.error = e.what();
        return result;
    } catch (const Error& e) {
        result.error = e.what();
        return result;
    }

    result.ok = true;
    return result;
}

std::optional<TreeNode> load_element(const std::string& root_dir,
                                     const TreePath& relative_path,
                                     const TreeLoadOptions& options,
                                     LoadSession& session) {
    TreeNode node;
    node.name = options.root_name;
    node.path = {options.root_name};
    node.location = root_dir;
    node.locations = {root_dir};
    bool is_command = false;

    for (const auto& segment : relative_path) {
        if (is_command) {
            return std::nullopt;
        }
        // A group hidden for this track hides everything below it
        load_common_type(node.locations, node.path, options.release_track, session, false);

        SubElements subs = find_sub_elements(node.locations, node.path);
        auto found = subs.groups.find(segment);
        if (found == subs.groups.end()) {
            found = subs.commands.find(segment);
            if (found == subs.commands.end()) {
                return std::nullopt;
            }
            is_command = true;
        }

        node.name = segment;
        node.path.push_back(segment);
        node.locations = found->second;
        node.location = node.locations.front();
    }

    spdlog::debug("Loading element {} for track {}", join_path(node.path),
                  release_track_id(options.release_track));
    node.artifact = load_common_type(node.locations, node.path, options.release_track,
                                     session, is_command);
    return node;
}

const TreeNode* find_node(const TreeNode& root, const TreePath& relative_path) {
    const TreeNode* current = &root;
    for (const auto& segment : relative_path) {
        const TreeNode* next = nullptr;
        for (const auto& group : current->groups) {
            if (group.name == segment) {
                next = &group;
                break;
            }
        }
        if (!next) {
            for (const auto& command : current->commands) {
                if (command.name == segment) {
                    next = &command;
                    break;
                }
            }
        }
        if (!next) return nullptr;
        current = next;
    }
    return current;
}

nlohmann::json tree_to_json(const TreeNode& node) {
    nlohmann::json j;
    j["name"] = node.name;
    j["path"] = join_path(node.path);
    j["location"] = node.location;
    if (node.artifact) {
        j["kind"] = artifact_kind_to_string(node.artifact->kind());
        nlohmann::json tracks = nlohmann::json::array();
        for (auto track : node.artifact->valid_release_tracks()) {
            tracks.push_back(release_track_id(track));
        }
        j["release_tracks"] = tracks;
    }
    if (!node.artifact || node.artifact->kind() == ArtifactKind::Group) {
        j["groups"] = nlohmann::json::array();
        for (const auto& group : node.groups) {
            j["groups"].push_back(tree_to_json(group));
        }
        j["commands"] = nlohmann::json::array();
        for (const auto& command : node.commands) {
            j["commands"].push_back(tree_to_json(command));
        }
    }
    return j;
}

size_t count_nodes(const TreeNode& node) {
    size_t count = 1;
    for (const auto& group : node.groups) count += count_nodes(group);
    for (const auto& command : node.commands) count += count_nodes(command);
    return count;
}

} // namespace cmdtree
