#pragma once

#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

#include "PlaylistTree.hpp"
#include "Track.hpp"

namespace autocrate {

/**
 * The in-memory collection document: every track record in document order
 * plus the playlists the document already carries. Reading and writing the
 * document itself happens outside this library.
 */
class Collection {
public:
    Collection() = default;
    explicit Collection(std::vector<Track> tracks);

    /**
     * Add a track record.
     * @throws std::invalid_argument if a track with the same id exists
     */
    void addTrack(Track track);

    /**
     * Every track record, including location-less membership artifacts.
     */
    const std::vector<Track>& getAllTracks() const { return tracks_; }

    /**
     * Iterate over real tracks (those with a location) in document order.
     * @param callback Called for each track, return false to stop
     */
    void forEachTrack(const std::function<bool(const Track&)>& callback) const;

    /**
     * Number of real tracks.
     */
    std::size_t getTrackCount() const;

    /**
     * Find a track record by id.
     */
    std::optional<Track> findTrack(const TrackId& id) const;

    /**
     * Playlists already present in the document.
     */
    PlaylistTree& getPlaylists() { return playlists_; }
    const PlaylistTree& getPlaylists() const { return playlists_; }

private:
    std::vector<Track> tracks_;
    std::unordered_map<TrackId, std::size_t> index_;
    PlaylistTree playlists_;
};

} // namespace autocrate
