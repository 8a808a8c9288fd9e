#include "cmdtree/loader.hpp"
#include "cmdtree/discovery.hpp"
#include "cmdtree/errors.hpp"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace cmdtree {

namespace fs = std::filesystem;

namespace {

constexpr const char* MODULE_NAME_PREFIX = "__cmdtree__command__";

// The stub file backing a native module location
std::string resolve_module_file(const std::string& location) {
    std::error_code ec;
    if (fs::is_directory(location, ec)) {
        std::string marker = (fs::path(location) / PACKAGE_MARKER).string();
        if (!fs::is_regular_file(marker, ec)) {
            throw std::runtime_error("Package [" + location + "] has no " + PACKAGE_MARKER);
        }
        return marker;
    }
    if (!fs::is_regular_file(location, ec)) {
        throw std::runtime_error("Module file [" + location + "] does not exist");
    }
    return location;
}

std::string join_names(const std::vector<ArtifactPtr>& artifacts) {
    std::string result;
    for (const auto& artifact : artifacts) {
        if (!result.empty()) result += ", ";
        result += artifact->name();
    }
    return result;
}

} // namespace

// ============================================================================
// LoadSession
// ============================================================================

LoadSession::LoadSession(std::string construction_id,
                         const ModuleCatalog& catalog,
                         SpecTranslator* translator)
    : construction_id_(std::move(construction_id)),
      catalog_(catalog),
      translator_(translator) {}

std::string LoadSession::module_name_for(const TreePath& path) const {
    return std::string(MODULE_NAME_PREFIX) + "." + construction_id_ + "." +
           normalize_module_path(path);
}

std::shared_ptr<const Module> LoadSession::import_module(const std::string& location,
                                                        const TreePath& path) {
    std::string name = module_name_for(path);

    // Any failure inside a single module must not take down the rest of the
    // tree, so everything is rethrown as LoadFailure for this element.
    try {
        std::string module_file = resolve_module_file(location);

        auto existing = modules_.find(name);
        if (existing != modules_.end()) {
            if (existing->second->file == module_file) {
                return existing->second;
            }
            throw LoadFailure(join_path(path), "Module name [" + name + "] is already imported from [" +
                                                   existing->second->file + "]");
        }

        std::string module_path = normalize_module_path(path);
        const ModuleBuilder* builder = catalog_.find(module_path);
        if (builder == nullptr) {
            throw std::runtime_error("No native module registered for [" + module_path + "]");
        }

        spdlog::debug("Importing {} as {}", module_file, name);

        auto module = std::make_shared<Module>();
        module->name = name;
        module->file = module_file;
        module->definitions = (*builder)(ModuleRequest{path, location, module_file});

        modules_.emplace(name, module);
        return module;
    } catch (const LoadFailure&) {
        throw;
    } catch (...) {
        throw LoadFailure(join_path(path), std::current_exception());
    }
}

std::string make_construction_id() {
    static std::mt19937_64 rng(std::random_device{}() ^
        static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::ostringstream ss;
    ss << "s" << std::hex << std::setw(16) << std::setfill('0') << rng();
    return ss.str();
}

// ============================================================================
// Candidate Collection
// ============================================================================

std::vector<Implementation> implementations_from_spec(const TreePath& path,
                                                      const nlohmann::json& data,
                                                      SpecTranslator* translator,
                                                      const std::string& spec_file) {
    if (translator == nullptr) {
        throw LoadFailure(join_path(path), "No yaml command translator has been registered");
    }

    std::vector<Implementation> implementations;
    if (data.is_null()) {
        return implementations;
    }
    if (!data.is_array()) {
        throw LayoutError("Spec file [" + spec_file + "] must contain a list of command definitions");
    }

    for (const auto& entry : data) {
        if (!entry.is_object()) {
            throw LayoutError("Spec file [" + spec_file + "] contains a command definition "
                              "that is not a mapping");
        }
        Implementation impl;
        impl.tracks = read_release_tracks(entry, spec_file);
        impl.producer = [translator, path, entry]() { return translator->translate(path, entry); };
        implementations.push_back(std::move(impl));
    }
    return implementations;
}

std::vector<Implementation> implementations_from_module(const Module& module, bool is_command) {
    std::vector<ArtifactPtr> commands;
    std::vector<ArtifactPtr> groups;
    for (const auto& definition : module.definitions) {
        if (!definition) continue;
        if (definition->kind() == ArtifactKind::Command) {
            commands.push_back(definition);
        } else {
            groups.push_back(definition);
        }
    }

    const std::vector<ArtifactPtr>* selected = nullptr;
    if (is_command) {
        if (!groups.empty()) {
            throw LayoutError("You cannot define groups [" + join_names(groups) +
                              "] in a command file: [" + module.file + "]");
        }
        if (commands.empty()) {
            throw LayoutError("No commands defined in file: [" + module.file + "]");
        }
        selected = &commands;
    } else {
        if (!commands.empty()) {
            throw LayoutError("You cannot define commands [" + join_names(commands) +
                              "] in a command group file: [" + module.file + "]");
        }
        if (groups.empty()) {
            throw LayoutError("No command groups defined in file: [" + module.file + "]");
        }
        selected = &groups;
    }

    std::vector<Implementation> implementations;
    for (const auto& definition : *selected) {
        Implementation impl;
        impl.tracks = definition->valid_release_tracks();
        impl.producer = [definition]() { return definition; };
        implementations.push_back(std::move(impl));
    }
    return implementations;
}

// ============================================================================
// load_common_type
// ============================================================================

ArtifactPtr load_common_type(const std::vector<std::string>& impl_paths,
                             const TreePath& path,
                             ReleaseTrack release_track,
                             LoadSession& session,
                             bool is_command) {
    if (impl_paths.empty()) {
        throw LoadFailure(join_path(path), "No implementation found");
    }

    std::vector<Implementation> implementations;
    for (const auto& impl_file : impl_paths) {
        std::vector<Implementation> found;
        if (is_spec_file(impl_file)) {
            if (!is_command) {
                throw LoadFailure(join_path(path), "Command groups cannot be implemented in yaml");
            }
            nlohmann::json data = session.spec_loader().load(impl_file);
            found = implementations_from_spec(path, data, session.translator(), impl_file);
        } else {
            auto module = session.import_module(impl_file, path);
            found = implementations_from_module(*module, is_command);
        }
        implementations.insert(implementations.end(),
                               std::make_move_iterator(found.begin()),
                               std::make_move_iterator(found.end()));
    }

    Producer producer = extract_release_track_implementation(
        impl_paths[0], release_track, implementations);

    ArtifactPtr artifact = producer();
    if (!artifact) {
        throw LoadFailure(join_path(path), "Implementation produced no artifact");
    }
    ArtifactKind expected = is_command ? ArtifactKind::Command : ArtifactKind::Group;
    if (artifact->kind() != expected) {
        throw LayoutError("Element [" + join_path(path) + "] resolved to a " +
                          artifact_kind_to_string(artifact->kind()) + " but a " +
                          artifact_kind_to_string(expected) + " was expected");
    }
    return artifact;
}

} // namespace cmdtree
