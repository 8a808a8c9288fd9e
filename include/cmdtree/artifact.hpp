#pragma once

#include "cmdtree/release_track.hpp"

#include <memory>
#include <string>
#include <utility>

namespace cmdtree {

// ============================================================================
// Artifact Kind
// ============================================================================

enum class ArtifactKind {
    Command,
    Group
};

inline const char* artifact_kind_to_string(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::Command: return "command";
        case ArtifactKind::Group: return "group";
    }
    return "command";
}

// ============================================================================
// Artifact
// ============================================================================

/**
 * The fully constructed command or group produced by a native module or by a
 * SpecTranslator. The loader only looks at the kind tag, the name and the
 * declared release tracks; everything else belongs to the execution layer.
 *
 * An empty valid_release_tracks() set means "valid for whatever track the
 * parent requested".
 */
class Artifact {
public:
    virtual ~Artifact() = default;

    virtual ArtifactKind kind() const = 0;
    virtual const std::string& name() const = 0;
    virtual ReleaseTrackSet valid_release_tracks() const = 0;
};

using ArtifactPtr = std::shared_ptr<const Artifact>;

// Plain value artifact for native registrations
class BasicArtifact : public Artifact {
public:
    BasicArtifact(std::string name, ArtifactKind kind, ReleaseTrackSet tracks = {})
        : name_(std::move(name)), kind_(kind), tracks_(std::move(tracks)) {}

    ArtifactKind kind() const override { return kind_; }
    const std::string& name() const override { return name_; }
    ReleaseTrackSet valid_release_tracks() const override { return tracks_; }

private:
    std::string name_;
    ArtifactKind kind_;
    ReleaseTrackSet tracks_;
};

inline ArtifactPtr make_command(std::string name, ReleaseTrackSet tracks = {}) {
    return std::make_shared<BasicArtifact>(std::move(name), ArtifactKind::Command, std::move(tracks));
}

inline ArtifactPtr make_group(std::string name, ReleaseTrackSet tracks = {}) {
    return std::make_shared<BasicArtifact>(std::move(name), ArtifactKind::Group, std::move(tracks));
}

} // namespace cmdtree
