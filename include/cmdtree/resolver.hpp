#pragma once

#include "cmdtree/artifact.hpp"
#include "cmdtree/release_track.hpp"

#include <functional>
#include <string>
#include <vector>

namespace cmdtree {

// ============================================================================
// Implementation Candidates
// ============================================================================

// Deferred construction of an artifact; only the winning candidate runs
using Producer = std::function<ArtifactPtr()>;

struct Implementation {
    Producer producer;
    ReleaseTrackSet tracks;  // empty = valid for the parent's requested track
};

// ============================================================================
// Release-Track Resolution
// ============================================================================

/**
 * Pick the one implementation valid for expected_track.
 *
 * A single implementation with no declared tracks is valid for any track.
 * When there are several, each must declare its tracks and no track may be
 * claimed twice across the whole list.
 *
 * @param impl_file  source location used in error messages
 * @return the winning producer, not yet invoked
 * @throws LayoutError  undeclared tracks among several, or duplicated tracks
 * @throws ReleaseTrackNotImplementedError  nothing implements expected_track
 */
Producer extract_release_track_implementation(const std::string& impl_file,
                                              ReleaseTrack expected_track,
                                              const std::vector<Implementation>& implementations);

} // namespace cmdtree
