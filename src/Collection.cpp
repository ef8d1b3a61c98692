#include "autocrate/Collection.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace autocrate {

Collection::Collection(std::vector<Track> tracks) {
    tracks_.reserve(tracks.size());
    for (auto& track : tracks) {
        addTrack(std::move(track));
    }
}

void Collection::addTrack(Track track) {
    if (index_.contains(track.getId())) {
        throw std::invalid_argument(fmt::format("Duplicate track id {}", track.getId()));
    }
    index_.emplace(track.getId(), tracks_.size());
    tracks_.push_back(std::move(track));
}

void Collection::forEachTrack(const std::function<bool(const Track&)>& callback) const {
    for (const auto& track : tracks_) {
        if (!track.hasLocation()) {
            continue;
        }
        if (!callback(track)) {
            break;
        }
    }
}

std::size_t Collection::getTrackCount() const {
    std::size_t count = 0;
    for (const auto& track : tracks_) {
        if (track.hasLocation()) {
            ++count;
        }
    }
    return count;
}

std::optional<Track> Collection::findTrack(const TrackId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return tracks_[it->second];
}

} // namespace autocrate
