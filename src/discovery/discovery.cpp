#include "cmdtree/discovery.hpp"
#include "cmdtree/errors.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace cmdtree {

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool has_uppercase(const std::string& name) {
    return std::any_of(name.begin(), name.end(),
                       [](unsigned char c) { return std::isupper(c) != 0; });
}

bool is_private(const std::string& name) {
    return name.empty() || name[0] == '_' || name[0] == '.';
}

// Sorted names of the packages and command files directly under dir
void list_package(const std::string& dir,
                  std::vector<std::string>& packages,
                  std::vector<std::string>& modules) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return;
    }

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::string name = entry.path().filename().string();
        if (is_private(name)) continue;

        std::error_code entry_ec;
        if (entry.is_directory(entry_ec)) {
            if (fs::is_regular_file(entry.path() / PACKAGE_MARKER, entry_ec)) {
                packages.push_back(name);
            }
        } else if (entry.is_regular_file(entry_ec)) {
            if (ends_with(name, MODULE_EXTENSION) || ends_with(name, SPEC_EXTENSION)) {
                modules.push_back(name);
            }
        }
    }
    if (ec) {
        spdlog::warn("Failed to list {}: {}", dir, ec.message());
    }

    std::sort(packages.begin(), packages.end());
    std::sort(modules.begin(), modules.end());
}

CandidateSet generate_element_info(const std::string& impl_path,
                                   const std::vector<std::string>& names) {
    CandidateSet elements;
    for (const auto& name : names) {
        if (has_uppercase(name)) {
            throw LayoutError("Commands and groups cannot have capital letters: " + name + ".");
        }
        std::string sub_path = (fs::path(impl_path) / name).string();
        elements[element_name_for_entry(name)].push_back(sub_path);
    }
    return elements;
}

} // namespace

bool is_spec_file(const std::string& location) {
    return ends_with(location, SPEC_EXTENSION);
}

std::string element_name_for_entry(const std::string& entry_name) {
    for (const std::string ext : {SPEC_EXTENSION, MODULE_EXTENSION}) {
        if (ends_with(entry_name, ext)) {
            return entry_name.substr(0, entry_name.size() - ext.size());
        }
    }
    return entry_name;
}

SubElements find_sub_elements(const std::vector<std::string>& impl_paths,
                              const TreePath& path) {
    if (impl_paths.size() > 1) {
        throw LoadFailure(join_path(path), "Command groups cannot be implemented in yaml");
    }
    if (impl_paths.empty()) {
        throw LoadFailure(join_path(path), "No implementation found for group");
    }

    const std::string& impl_path = impl_paths[0];
    std::vector<std::string> packages;
    std::vector<std::string> modules;
    list_package(impl_path, packages, modules);

    spdlog::debug("Discovered {} group(s) and {} command file(s) under {}",
                  packages.size(), modules.size(), impl_path);

    SubElements result;
    result.groups = generate_element_info(impl_path, packages);
    result.commands = generate_element_info(impl_path, modules);
    return result;
}

} // namespace cmdtree
