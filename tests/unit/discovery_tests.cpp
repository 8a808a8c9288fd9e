#include <doctest/doctest.h>
#include <cmdtree/discovery.hpp>
#include <cmdtree/errors.hpp>

#include "../test_helpers.hpp"

#include <filesystem>

using namespace cmdtree;
using cmdtree::test::TempTestDir;
using cmdtree::test::contains;
using cmdtree::test::error_message;

namespace {

std::string join(const std::string& dir, const std::string& name) {
    return (std::filesystem::path(dir) / name).string();
}

} // namespace

TEST_CASE("find_sub_elements separates groups from commands") {
    TempTestDir temp;
    temp.package("compute");
    temp.package("storage");
    temp.write("version.impl");
    temp.write("info.yaml", "- help_text: info\n");

    auto subs = find_sub_elements({temp.path}, {"cli"});

    REQUIRE(subs.groups.size() == 2);
    CHECK(subs.groups.at("compute") == std::vector<std::string>{join(temp.path, "compute")});
    CHECK(subs.groups.at("storage") == std::vector<std::string>{join(temp.path, "storage")});

    REQUIRE(subs.commands.size() == 2);
    CHECK(subs.commands.at("version") == std::vector<std::string>{join(temp.path, "version.impl")});
    CHECK(subs.commands.at("info") == std::vector<std::string>{join(temp.path, "info.yaml")});
}

TEST_CASE("find_sub_elements merges native and declarative sources by name") {
    TempTestDir temp;
    temp.write("create.impl");
    temp.write("create.yaml", "- release_tracks: [ALPHA]\n");

    auto subs = find_sub_elements({temp.path}, {"cli"});

    REQUIRE(subs.commands.count("create") == 1);
    const auto& locations = subs.commands.at("create");
    REQUIRE(locations.size() == 2);
    CHECK(locations[0] == join(temp.path, "create.impl"));
    CHECK(locations[1] == join(temp.path, "create.yaml"));
}

TEST_CASE("find_sub_elements skips private and unrelated entries") {
    TempTestDir temp;
    temp.write("__init__.impl");
    temp.write("__init__.yaml", "foo: {a: b}\n");
    temp.write("_helpers.impl");
    temp.write(".hidden.yaml");
    temp.write("README.md", "docs");
    temp.write("notes.txt");
    std::filesystem::create_directories(temp.sub("not_a_package"));
    temp.package("_private_group");
    temp.write("list.yaml", "- {}\n");

    auto subs = find_sub_elements({temp.path}, {"cli"});

    CHECK(subs.groups.empty());
    REQUIRE(subs.commands.size() == 1);
    CHECK(subs.commands.count("list") == 1);
}

TEST_CASE("find_sub_elements rejects uppercase names") {
    SUBCASE("command file") {
        TempTestDir temp;
        temp.write("ok.yaml");
        temp.write("Describe.yaml");
        auto msg = error_message<LayoutError>([&] { find_sub_elements({temp.path}, {"cli"}); });
        CHECK(contains(msg, "Describe.yaml"));
        CHECK(contains(msg, "capital letters"));
    }

    SUBCASE("group directory") {
        TempTestDir temp;
        temp.package("Compute");
        auto msg = error_message<LayoutError>([&] { find_sub_elements({temp.path}, {"cli"}); });
        CHECK(msg == "Commands and groups cannot have capital letters: Compute.");
    }

    SUBCASE("native module") {
        TempTestDir temp;
        temp.write("listAll.impl");
        CHECK_THROWS_AS(find_sub_elements({temp.path}, {"cli"}), LayoutError);
    }
}

TEST_CASE("find_sub_elements refuses groups split across files") {
    TempTestDir temp;
    auto a = temp.write("group.yaml", "- {}\n");
    auto b = temp.write("other/group.yaml", "- {}\n");

    try {
        find_sub_elements({a, b}, {"cli", "group"});
        FAIL("expected LoadFailure");
    } catch (const LoadFailure& e) {
        CHECK(e.location() == "cli.group");
        CHECK(contains(e.what(), "Command groups cannot be implemented in yaml"));
    }
}

TEST_CASE("find_sub_elements on a missing directory finds nothing") {
    TempTestDir temp;
    auto subs = find_sub_elements({temp.sub("does_not_exist")}, {"cli"});
    CHECK(subs.groups.empty());
    CHECK(subs.commands.empty());
}

TEST_CASE("find_sub_elements is deterministic") {
    TempTestDir temp;
    temp.write("b.yaml");
    temp.write("a.yaml");
    temp.write("c.impl");

    auto first = find_sub_elements({temp.path}, {"cli"});
    auto second = find_sub_elements({temp.path}, {"cli"});
    CHECK(first.commands == second.commands);

    std::vector<std::string> names;
    for (const auto& kv : first.commands) names.push_back(kv.first);
    CHECK(names == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("element_name_for_entry strips known extensions") {
    CHECK(element_name_for_entry("create.yaml") == "create");
    CHECK(element_name_for_entry("create.impl") == "create");
    CHECK(element_name_for_entry("instances") == "instances");
    CHECK(element_name_for_entry("archive.tar") == "archive.tar");
}

TEST_CASE("is_spec_file") {
    CHECK(is_spec_file("/a/b/create.yaml"));
    CHECK_FALSE(is_spec_file("/a/b/create.impl"));
    CHECK_FALSE(is_spec_file("/a/b/yaml"));
}
