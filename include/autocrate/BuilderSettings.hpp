#pragma once

#include <string>
#include <vector>

#include "LeafFilter.hpp"

namespace autocrate {

/**
 * Tunables of a playlist build, with the defaults of the stock tool.
 */
class BuilderSettings {
public:
    static constexpr const char* DEFAULT_ROOT_NAME = "AUTO_PLAYLISTS";
    static constexpr const char* DEFAULT_GENRE_DELIMITER = "/";
    static constexpr const char* REMAINDER_FOLDER = "folder";
    static constexpr const char* REMAINDER_PLAYLIST = "playlist";

    BuilderSettings();

    /**
     * Genres that get a synthetic "Pure <genre>" tag on tracks whose every
     * genre contains them.
     */
    BuilderSettings& setPureGenrePlaylists(std::vector<std::string> genres);
    const std::vector<std::string>& getPureGenrePlaylists() const { return pureGenrePlaylists_; }

    /**
     * @throws std::invalid_argument if the delimiter is empty
     */
    BuilderSettings& setGenreDelimiter(std::string delimiter);
    const std::string& getGenreDelimiter() const { return genreDelimiter_; }

    /**
     * How tags missing from a taxonomy are bucketed: "folder" (one playlist
     * per tag inside an "Other" folder), "playlist" (a single "Other"
     * playlist) or empty to disable. Any other value is reported when the
     * build runs and bucketing is skipped.
     */
    BuilderSettings& setRemainderType(std::string type) { remainderType_ = std::move(type); return *this; }
    const std::string& getRemainderType() const { return remainderType_; }

    /**
     * @throws std::invalid_argument if the name is empty
     */
    BuilderSettings& setRootName(std::string name);
    const std::string& getRootName() const { return rootName_; }

    BuilderSettings& setLeafFilters(std::vector<LeafFilter> filters) { leafFilters_ = std::move(filters); return *this; }
    BuilderSettings& addLeafFilter(LeafFilter filter) { leafFilters_.push_back(std::move(filter)); return *this; }
    const std::vector<LeafFilter>& getLeafFilters() const { return leafFilters_; }

private:
    std::vector<std::string> pureGenrePlaylists_;
    std::string genreDelimiter_{DEFAULT_GENRE_DELIMITER};
    std::string remainderType_;
    std::string rootName_{DEFAULT_ROOT_NAME};
    std::vector<LeafFilter> leafFilters_;
};

} // namespace autocrate
