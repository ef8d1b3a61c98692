#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace autocrate {

/**
 * Library version.
 */
struct Version {
    static constexpr int MAJOR = 0;
    static constexpr int MINOR = 3;
    static constexpr int PATCH = 0;
    static constexpr const char* STRING = "0.3.0";
};

/**
 * Opaque, stable track identifier as found in the collection document.
 */
using TrackId = std::string;

using TrackIdSet = std::set<TrackId>;

/**
 * A track recorded under one tag, together with the full tag list the
 * track produced. The leaf disambiguation rules decide on the full list,
 * the track's non-genre tags and its raw comments.
 */
struct TagTrackEntry {
    TrackId trackId;
    std::vector<std::string> tags;
    std::vector<std::string> otherTags;
    std::string comments;

    bool operator==(const TagTrackEntry& other) const {
        return trackId == other.trackId && tags == other.tags && otherTags == other.otherTags
            && comments == other.comments;
    }
};

/**
 * Tag -> tracks carrying it, in collection order.
 */
using TagTracks = std::map<std::string, std::vector<TagTrackEntry>>;

/**
 * Tag (or selector literal) -> identifiers of the tracks carrying it.
 */
using TagTrackIds = std::map<std::string, TrackIdSet>;

} // namespace autocrate
