#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cmdtree {

// ============================================================================
// Release Track
// ============================================================================

/**
 * A named channel under which a command or group may carry its own
 * implementation. Only equality and set membership are meaningful; the
 * enum order is used for deterministic formatting.
 */
enum class ReleaseTrack {
    GA,
    BETA,
    ALPHA
};

using ReleaseTrackSet = std::set<ReleaseTrack>;

// Stable identifier ("GA", "BETA", "ALPHA") used in spec files and messages
inline const char* release_track_id(ReleaseTrack track) {
    switch (track) {
        case ReleaseTrack::GA: return "GA";
        case ReleaseTrack::BETA: return "BETA";
        case ReleaseTrack::ALPHA: return "ALPHA";
    }
    return "GA";
}

// Command-line prefix; empty for GA
inline const char* release_track_prefix(ReleaseTrack track) {
    switch (track) {
        case ReleaseTrack::GA: return "";
        case ReleaseTrack::BETA: return "beta";
        case ReleaseTrack::ALPHA: return "alpha";
    }
    return "";
}

// Help text marker prepended to command descriptions; empty for GA
inline const char* release_track_help_tag(ReleaseTrack track) {
    switch (track) {
        case ReleaseTrack::GA: return "";
        case ReleaseTrack::BETA: return "(BETA) ";
        case ReleaseTrack::ALPHA: return "(ALPHA) ";
    }
    return "";
}

// Parse a track id (exact match, e.g. "BETA")
std::optional<ReleaseTrack> parse_release_track_id(const std::string& id);

// Parse a command-line prefix ("" for GA, "beta", "alpha")
std::optional<ReleaseTrack> parse_release_track_prefix(const std::string& prefix);

// All tracks in enum order
std::vector<ReleaseTrack> all_release_tracks();

// Comma-joined track ids in enum order, e.g. "BETA, ALPHA"
std::string format_release_tracks(const ReleaseTrackSet& tracks);

} // namespace cmdtree
