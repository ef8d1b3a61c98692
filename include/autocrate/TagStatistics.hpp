#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "PlaylistTree.hpp"
#include "Types.hpp"

namespace autocrate {

/**
 * Tags a track produced, split by source.
 */
struct TrackTags {
    std::vector<std::string> genre;  // from the genre parser
    std::vector<std::string> other;  // from every other parser

    std::vector<std::string> all() const;
};

using TrackTagMap = std::map<TrackId, TrackTags>;

/**
 * How many tracks of one playlist carry each tag.
 */
struct PlaylistTagStatistics {
    std::string playlist;
    std::map<std::string, int> genre;
    std::map<std::string, int> other;
};

/**
 * Tag histograms for generated playlists, meant for eyeballing whether a
 * Combiner expression selects what its author intended.
 */
class TagStatistics {
public:
    static constexpr int DEFAULT_HEIGHT = 25;

    using Counts = std::vector<std::pair<std::string, int>>;

    /**
     * Statistics for every non-empty playlist under folder, depth-first.
     */
    static std::vector<PlaylistTagStatistics> compute(const PlaylistTree& tree, NodeIndex folder,
                                                      const TrackTagMap& trackTags);

    /**
     * Rescale counts so the largest becomes maximum; no count drops below 1.
     */
    static Counts scale(const Counts& counts, int maximum = DEFAULT_HEIGHT);

    /**
     * ASCII column chart of the counts, one column per tag, labels below.
     * Zero counts are dropped; an empty chart renders as "".
     */
    static std::string renderHistogram(const Counts& counts, int maximum = DEFAULT_HEIGHT);

    /**
     * Titled Genre and Other histograms for every playlist.
     */
    static std::string render(const std::vector<PlaylistTagStatistics>& statistics);

private:
    TagStatistics() = delete;
};

} // namespace autocrate
