#include "cmdtree/translator.hpp"
#include "cmdtree/errors.hpp"

#include <memory>

namespace cmdtree {

DeclarativeCommand::DeclarativeCommand(std::string name, nlohmann::json data, ReleaseTrackSet tracks)
    : name_(std::move(name)), data_(std::move(data)), tracks_(std::move(tracks)) {}

ArtifactPtr PassthroughTranslator::translate(const TreePath& path, const nlohmann::json& command_data) {
    std::string name = path.empty() ? std::string() : path.back();
    return std::make_shared<DeclarativeCommand>(
        name, command_data, read_release_tracks(command_data, join_path(path)));
}

ReleaseTrackSet read_release_tracks(const nlohmann::json& entry, const std::string& source_path) {
    ReleaseTrackSet tracks;
    if (!entry.is_object()) {
        return tracks;
    }
    auto it = entry.find("release_tracks");
    if (it == entry.end() || it->is_null()) {
        return tracks;
    }
    if (!it->is_array()) {
        throw LayoutError("release_tracks in [" + source_path + "] must be a list of track ids");
    }
    for (const auto& value : *it) {
        if (!value.is_string()) {
            throw LayoutError("release_tracks in [" + source_path + "] must be a list of track ids");
        }
        auto track = parse_release_track_id(value.get<std::string>());
        if (!track) {
            throw LayoutError("Unknown release track id [" + value.get<std::string>() +
                              "] in [" + source_path + "]");
        }
        tracks.insert(*track);
    }
    return tracks;
}

} // namespace cmdtree
