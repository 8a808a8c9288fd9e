#pragma once

#include "cmdtree/artifact.hpp"
#include "cmdtree/module_catalog.hpp"
#include "cmdtree/release_track.hpp"
#include "cmdtree/resolver.hpp"
#include "cmdtree/spec_loader.hpp"
#include "cmdtree/translator.hpp"
#include "cmdtree/types.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace cmdtree {

// ============================================================================
// Load Session
// ============================================================================

/**
 * State owned by one loading pass over a command tree: the uniqueness token,
 * the imported-module registry and the common-data cache. Sessions are not
 * thread safe; concurrent sessions need their own instance and a distinct
 * construction_id.
 */
class LoadSession {
public:
    LoadSession(std::string construction_id,
                const ModuleCatalog& catalog,
                SpecTranslator* translator = nullptr);

    const std::string& construction_id() const { return construction_id_; }
    const ModuleCatalog& catalog() const { return catalog_; }
    SpecTranslator* translator() const { return translator_; }
    SpecLoader& spec_loader() { return spec_loader_; }

    /**
     * Import the native module implementing location under a synthesized
     * name unique to this session. Importing the same location twice returns
     * the cached module.
     *
     * Every failure (missing stub, missing registration, builder exception,
     * name collision) is rethrown as LoadFailure for the joined path.
     */
    std::shared_ptr<const Module> import_module(const std::string& location, const TreePath& path);

    // __cmdtree__command__.<construction_id>.<normalized path>
    std::string module_name_for(const TreePath& path) const;

    size_t imported_module_count() const { return modules_.size(); }

private:
    std::string construction_id_;
    const ModuleCatalog& catalog_;
    SpecTranslator* translator_;
    SpecLoader spec_loader_;
    std::unordered_map<std::string, std::shared_ptr<const Module>> modules_;
};

// Fresh token for a LoadSession
std::string make_construction_id();

// ============================================================================
// Implementation Loading
// ============================================================================

/**
 * Load the command or group implemented by impl_paths for release_track.
 *
 * Spec files contribute one candidate per entry, native modules one per
 * qualifying definition. The candidates are resolved against impl_paths[0]
 * and the winning producer is invoked.
 *
 * @throws LoadFailure, LayoutError, ReleaseTrackNotImplementedError
 */
ArtifactPtr load_common_type(const std::vector<std::string>& impl_paths,
                             const TreePath& path,
                             ReleaseTrack release_track,
                             LoadSession& session,
                             bool is_command);

// Candidates from a composed spec document (a sequence of mappings)
std::vector<Implementation> implementations_from_spec(const TreePath& path,
                                                      const nlohmann::json& data,
                                                      SpecTranslator* translator,
                                                      const std::string& spec_file);

// Candidates from a module's definitions, checking the expected kind
std::vector<Implementation> implementations_from_module(const Module& module, bool is_command);

} // namespace cmdtree
