#pragma once

#include "cmdtree/artifact.hpp"
#include "cmdtree/types.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cmdtree {

// ============================================================================
// Native Modules
// ============================================================================

// What the loader knows when it asks for a module
struct ModuleRequest {
    TreePath path;            // tree path of the element
    std::string location;     // candidate location (stub file or package dir)
    std::string module_file;  // the stub file that was found for location
};

// Returns the module's top-level definitions
using ModuleBuilder = std::function<std::vector<ArtifactPtr>(const ModuleRequest&)>;

// An imported native module
struct Module {
    std::string name;         // synthesized, session-unique name
    std::string file;         // module_file it was imported from
    std::vector<ArtifactPtr> definitions;
};

// ============================================================================
// Module Catalog
// ============================================================================

/**
 * Explicit registry of native module builders keyed by normalized tree path
 * (see normalize_module_path). A fallback builder, if set, serves every key
 * without an exact registration.
 */
class ModuleCatalog {
public:
    ModuleCatalog() = default;

    // Process-wide catalog filled by CMDTREE_REGISTER_MODULE
    static ModuleCatalog& global();

    void add(const std::string& module_path, ModuleBuilder builder);
    void set_fallback(ModuleBuilder builder);

    bool contains(const std::string& module_path) const;

    // Builder for module_path, the fallback, or nullptr
    const ModuleBuilder* find(const std::string& module_path) const;

    std::vector<std::string> registered_paths() const;

private:
    std::unordered_map<std::string, ModuleBuilder> builders_;
    ModuleBuilder fallback_;
};

// Registers a builder in ModuleCatalog::global() during static initialization
struct ModuleRegistrar {
    ModuleRegistrar(const std::string& module_path, ModuleBuilder builder) {
        ModuleCatalog::global().add(module_path, std::move(builder));
    }
};

} // namespace cmdtree

#define CMDTREE_CONCAT_INNER(a, b) a##b
#define CMDTREE_CONCAT(a, b) CMDTREE_CONCAT_INNER(a, b)

// CMDTREE_REGISTER_MODULE("gcloud.compute.instances_list", builder);
#define CMDTREE_REGISTER_MODULE(module_path, builder)                                  \
    static ::cmdtree::ModuleRegistrar CMDTREE_CONCAT(cmdtree_module_registrar_, __LINE__)( \
        module_path, builder)
