#include <doctest/doctest.h>
#include <cmdtree/errors.hpp>
#include <cmdtree/tree.hpp>

#include "../test_helpers.hpp"

#include <filesystem>
#include <stdexcept>

using namespace cmdtree;
using cmdtree::test::contains;
using cmdtree::test::TempTestDir;

namespace {

// Packages become groups and stubs become commands, all valid on every track
ModuleCatalog make_catalog() {
    ModuleCatalog catalog;
    catalog.set_fallback([](const ModuleRequest& request) {
        const std::string& name = request.path.back();
        if (std::filesystem::is_directory(request.location)) {
            return std::vector<ArtifactPtr>{make_group(name)};
        }
        return std::vector<ArtifactPtr>{make_command(name)};
    });
    return catalog;
}

/*
 * cli/
 *   compute/
 *     instances/
 *       list.impl
 *     create.yaml        (GA only)
 *     preview.yaml       (ALPHA only)
 *   version.impl
 *   _internal/           (private)
 */
void write_surface(const TempTestDir& temp) {
    temp.write("__init__.impl");
    temp.package("compute");
    temp.package("compute/instances");
    temp.write("compute/instances/list.impl");
    temp.write("compute/create.yaml", "- release_tracks: [GA]\n  help: create\n");
    temp.write("compute/preview.yaml", "- release_tracks: [ALPHA]\n  help: preview\n");
    temp.write("version.impl");
    temp.package("_internal");
}

std::vector<std::string> names(const std::vector<TreeNode>& nodes) {
    std::vector<std::string> result;
    for (const auto& node : nodes) result.push_back(node.name);
    return result;
}

} // namespace

TEST_CASE("load_command_tree builds the GA surface") {
    TempTestDir temp;
    write_surface(temp);
    auto catalog = make_catalog();
    PassthroughTranslator translator;
    LoadSession session("s1", catalog, &translator);

    auto result = load_command_tree(temp.path, TreeLoadOptions{}, session);
    REQUIRE(result.ok);
    CHECK(result.failures.empty());
    CHECK(result.root.name == "cli");
    CHECK(result.root.artifact->kind() == ArtifactKind::Group);
    CHECK(names(result.root.groups) == std::vector<std::string>{"compute"});
    CHECK(names(result.root.commands) == std::vector<std::string>{"version"});

    const TreeNode* compute = find_node(result.root, {"compute"});
    REQUIRE(compute != nullptr);
    CHECK(names(compute->commands) == std::vector<std::string>{"create"});
    CHECK(names(compute->groups) == std::vector<std::string>{"instances"});

    REQUIRE(result.skipped.size() == 1);
    CHECK(result.skipped[0] == TreePath{"cli", "compute", "preview"});

    CHECK(count_nodes(result.root) == 6);
}

TEST_CASE("load_command_tree follows the requested track") {
    TempTestDir temp;
    write_surface(temp);
    auto catalog = make_catalog();
    PassthroughTranslator translator;
    LoadSession session("s1", catalog, &translator);

    TreeLoadOptions options;
    options.release_track = ReleaseTrack::ALPHA;
    auto result = load_command_tree(temp.path, options, session);
    REQUIRE(result.ok);

    const TreeNode* compute = find_node(result.root, {"compute"});
    REQUIRE(compute != nullptr);
    CHECK(names(compute->commands) == std::vector<std::string>{"preview"});
    REQUIRE(result.skipped.size() == 1);
    CHECK(result.skipped[0] == TreePath{"cli", "compute", "create"});
}

TEST_CASE("failing nodes are recorded and siblings still load") {
    TempTestDir temp;
    write_surface(temp);
    temp.write("compute/broken.yaml", "- help: !COMMON missing\n");
    temp.package("network");
    temp.write("network.yaml", "- help: clash\n");

    auto catalog = make_catalog();
    PassthroughTranslator translator;
    LoadSession session("s1", catalog, &translator);

    auto result = load_command_tree(temp.path, TreeLoadOptions{}, session);
    REQUIRE(result.ok);
    REQUIRE(result.failures.size() == 1);
    CHECK(result.failures[0].path == TreePath{"cli", "compute", "broken"});
    CHECK(result.failures[0].kind == "layout_error");
    CHECK(contains(result.failures[0].message, "references common command data"));

    // network is both a package and a command spec; both load independently
    CHECK(find_node(result.root, {"network"}) != nullptr);
    CHECK(find_node(result.root, {"compute", "create"}) != nullptr);
}

TEST_CASE("native load failures degrade a single node") {
    TempTestDir temp;
    write_surface(temp);
    temp.write("compute/explode.impl");

    auto catalog = make_catalog();
    catalog.add("cli.compute.explode", [](const ModuleRequest&) -> std::vector<ArtifactPtr> {
        throw std::runtime_error("boom");
    });
    PassthroughTranslator translator;
    LoadSession session("s1", catalog, &translator);

    auto result = load_command_tree(temp.path, TreeLoadOptions{}, session);
    REQUIRE(result.ok);
    REQUIRE(result.failures.size() == 1);
    CHECK(result.failures[0].kind == "load_failure");
    CHECK(result.failures[0].message == "Problem loading cli.compute.explode: boom.");
    CHECK(find_node(result.root, {"compute", "explode"}) == nullptr);
}

TEST_CASE("fail_fast stops at the first failure") {
    TempTestDir temp;
    write_surface(temp);
    temp.write("compute/broken.yaml", "- help: !COMMON missing\n");

    auto catalog = make_catalog();
    PassthroughTranslator translator;
    LoadSession session("s1", catalog, &translator);

    TreeLoadOptions options;
    options.fail_fast = true;
    auto result = load_command_tree(temp.path, options, session);
    CHECK_FALSE(result.ok);
    CHECK(contains(result.error, "references common command data"));
    CHECK(result.failures.size() == 1);
}

TEST_CASE("uppercase names fail their parent group") {
    TempTestDir temp;
    write_surface(temp);
    temp.write("compute/Create.yaml", "- help: bad\n");

    auto catalog = make_catalog();
    PassthroughTranslator translator;
    LoadSession session("s1", catalog, &translator);

    auto result = load_command_tree(temp.path, TreeLoadOptions{}, session);
    REQUIRE(result.ok);
    CHECK(find_node(result.root, {"compute"}) == nullptr);
    REQUIRE(result.failures.size() == 1);
    CHECK(result.failures[0].path == TreePath{"cli", "compute"});
    CHECK(result.failures[0].message == "Commands and groups cannot have capital letters: Create.yaml.");
}

TEST_CASE("a root that cannot load fails the result") {
    TempTestDir temp;
    ModuleCatalog catalog;
    LoadSession session("s1", catalog);

    auto result = load_command_tree(temp.path, TreeLoadOptions{}, session);
    CHECK_FALSE(result.ok);
    CHECK(contains(result.error, "Problem loading cli"));
}

TEST_CASE("find_node and tree_to_json") {
    TempTestDir temp;
    write_surface(temp);
    auto catalog = make_catalog();
    PassthroughTranslator translator;
    LoadSession session("s1", catalog, &translator);

    TreeLoadOptions options;
    options.root_name = "gcloud";
    auto result = load_command_tree(temp.path, options, session);
    REQUIRE(result.ok);

    CHECK(find_node(result.root, {}) == &result.root);
    CHECK(find_node(result.root, {"compute", "missing"}) == nullptr);

    const TreeNode* list = find_node(result.root, {"compute", "instances", "list"});
    REQUIRE(list != nullptr);
    CHECK(list->path == TreePath{"gcloud", "compute", "instances", "list"});

    auto j = tree_to_json(result.root);
    CHECK(j["name"] == "gcloud");
    CHECK(j["kind"] == "group");
    CHECK(j["commands"][0]["name"] == "version");
    CHECK(j["commands"][0]["kind"] == "command");
    CHECK_FALSE(j["commands"][0].contains("groups"));

    auto create = tree_to_json(*find_node(result.root, {"compute", "create"}));
    CHECK(create["path"] == "gcloud.compute.create");
    CHECK(create["release_tracks"] == nlohmann::json::array({"GA"}));
}

TEST_CASE("load_element loads one element and the groups above it") {
    TempTestDir temp;
    write_surface(temp);
    auto catalog = make_catalog();
    PassthroughTranslator translator;
    LoadSession session("s1", catalog, &translator);

    auto node = load_element(temp.path, {"compute", "instances", "list"}, TreeLoadOptions{}, session);
    REQUIRE(node.has_value());
    CHECK(node->path == TreePath{"cli", "compute", "instances", "list"});
    CHECK(node->artifact->kind() == ArtifactKind::Command);
    CHECK(node->locations == std::vector<std::string>{temp.sub("compute/instances/list.impl")});
    CHECK(node->groups.empty());

    // root, compute, instances and list
    CHECK(session.imported_module_count() == 4);

    auto root = load_element(temp.path, {}, TreeLoadOptions{}, session);
    REQUIRE(root.has_value());
    CHECK(root->artifact->kind() == ArtifactKind::Group);
}

TEST_CASE("load_element returns nothing for unknown paths") {
    TempTestDir temp;
    write_surface(temp);
    auto catalog = make_catalog();
    PassthroughTranslator translator;
    LoadSession session("s1", catalog, &translator);

    CHECK_FALSE(load_element(temp.path, {"compute", "missing"}, TreeLoadOptions{}, session).has_value());
    CHECK_FALSE(load_element(temp.path, {"version", "child"}, TreeLoadOptions{}, session).has_value());
    CHECK_FALSE(load_element(temp.path, {"_internal"}, TreeLoadOptions{}, session).has_value());
}

TEST_CASE("load_element hides children of groups missing from the track") {
    TempTestDir temp;
    write_surface(temp);
    auto catalog = make_catalog();
    catalog.add("cli.compute", [](const ModuleRequest&) {
        return std::vector<ArtifactPtr>{make_group("compute", {ReleaseTrack::ALPHA})};
    });
    PassthroughTranslator translator;
    LoadSession session("s1", catalog, &translator);

    TreePath list_path = {"compute", "instances", "list"};
    CHECK_THROWS_AS(load_element(temp.path, list_path, TreeLoadOptions{}, session),
                    ReleaseTrackNotImplementedError);

    // The full walk agrees
    auto tree = load_command_tree(temp.path, TreeLoadOptions{}, session);
    REQUIRE(tree.ok);
    CHECK(find_node(tree.root, list_path) == nullptr);

    TreeLoadOptions alpha;
    alpha.release_track = ReleaseTrack::ALPHA;
    auto node = load_element(temp.path, list_path, alpha, session);
    REQUIRE(node.has_value());
    CHECK(node->artifact->name() == "list");
}

TEST_CASE("load_element reports the element's own track") {
    TempTestDir temp;
    write_surface(temp);
    auto catalog = make_catalog();
    PassthroughTranslator translator;
    LoadSession session("s1", catalog, &translator);

    CHECK_THROWS_AS(load_element(temp.path, {"compute", "preview"}, TreeLoadOptions{}, session),
                    ReleaseTrackNotImplementedError);

    TreeLoadOptions alpha;
    alpha.release_track = ReleaseTrack::ALPHA;
    auto node = load_element(temp.path, {"compute", "preview"}, alpha, session);
    REQUIRE(node.has_value());
    CHECK(node->location == temp.sub("compute/preview.yaml"));
}
