#include "cmdtree/release_track.hpp"

namespace cmdtree {

std::optional<ReleaseTrack> parse_release_track_id(const std::string& id) {
    for (auto track : all_release_tracks()) {
        if (id == release_track_id(track)) {
            return track;
        }
    }
    return std::nullopt;
}

std::optional<ReleaseTrack> parse_release_track_prefix(const std::string& prefix) {
    for (auto track : all_release_tracks()) {
        if (prefix == release_track_prefix(track)) {
            return track;
        }
    }
    return std::nullopt;
}

std::vector<ReleaseTrack> all_release_tracks() {
    return {ReleaseTrack::GA, ReleaseTrack::BETA, ReleaseTrack::ALPHA};
}

std::string format_release_tracks(const ReleaseTrackSet& tracks) {
    std::string result;
    for (auto track : tracks) {
        if (!result.empty()) result += ", ";
        result += release_track_id(track);
    }
    return result;
}

} // namespace cmdtree
