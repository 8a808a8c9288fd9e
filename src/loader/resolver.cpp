#include "cmdtree/resolver.hpp"
#include "cmdtree/errors.hpp"

namespace cmdtree {

namespace {

std::string not_implemented_message(ReleaseTrack track, const std::string& impl_file) {
    return std::string("No implementation for release track [") + release_track_id(track) +
           "] for element: [" + impl_file + "]";
}

} // namespace

Producer extract_release_track_implementation(const std::string& impl_file,
                                              ReleaseTrack expected_track,
                                              const std::vector<Implementation>& implementations) {
    // A lone implementation without declared tracks inherits the parent's track
    if (implementations.size() == 1) {
        const auto& impl = implementations.front();
        if (impl.tracks.empty() || impl.tracks.count(expected_track) > 0) {
            return impl.producer;
        }
        throw ReleaseTrackNotImplementedError(not_implemented_message(expected_track, impl_file));
    }

    for (const auto& impl : implementations) {
        if (impl.tracks.empty()) {
            throw LayoutError("Multiple implementations defined for element: [" + impl_file +
                              "]. Each must explicitly declare valid release tracks.");
        }
    }

    ReleaseTrackSet implemented;
    ReleaseTrackSet duplicates;
    for (const auto& impl : implementations) {
        for (auto track : impl.tracks) {
            if (!implemented.insert(track).second) {
                duplicates.insert(track);
            }
        }
    }
    if (!duplicates.empty()) {
        throw LayoutError("Multiple definitions for release tracks [" +
                          format_release_tracks(duplicates) + "] for element: [" +
                          impl_file + "]");
    }

    // At most one match remains after the disjointness check
    for (const auto& impl : implementations) {
        if (impl.tracks.count(expected_track) > 0) {
            return impl.producer;
        }
    }
    throw ReleaseTrackNotImplementedError(not_implemented_message(expected_track, impl_file));
}

} // namespace cmdtree
