#pragma once

#include "cmdtree/artifact.hpp"
#include "cmdtree/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace cmdtree {

// ============================================================================
// Spec Translator
// ============================================================================

// Turns one entry of a declarative spec file into a command artifact
class SpecTranslator {
public:
    virtual ~SpecTranslator() = default;

    /**
     * @param path          tree path of the command, for error reporting
     * @param command_data  the parsed entry matching the requested track
     * @return a command artifact implementing the entry
     */
    virtual ArtifactPtr translate(const TreePath& path, const nlohmann::json& command_data) = 0;
};

// ============================================================================
// Declarative Command
// ============================================================================

// Command artifact that keeps the composed spec entry as-is
class DeclarativeCommand : public Artifact {
public:
    DeclarativeCommand(std::string name, nlohmann::json data, ReleaseTrackSet tracks);

    ArtifactKind kind() const override { return ArtifactKind::Command; }
    const std::string& name() const override { return name_; }
    ReleaseTrackSet valid_release_tracks() const override { return tracks_; }

    const nlohmann::json& data() const { return data_; }

private:
    std::string name_;
    nlohmann::json data_;
    ReleaseTrackSet tracks_;
};

// Translator producing DeclarativeCommand artifacts
class PassthroughTranslator : public SpecTranslator {
public:
    ArtifactPtr translate(const TreePath& path, const nlohmann::json& command_data) override;
};

// Tracks listed in an entry's release_tracks field; empty if absent.
// Throws LayoutError on a malformed list or an unknown track id.
ReleaseTrackSet read_release_tracks(const nlohmann::json& entry, const std::string& source_path);

} // namespace cmdtree
