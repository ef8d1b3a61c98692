#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "Types.hpp"

namespace autocrate {

/**
 * A track record from the collection document. Read-only once built; the
 * document owns it and the playlist machinery refers to it by identifier.
 */
class Track {
public:
    /**
     * Highest tempo a track may carry.
     */
    static constexpr double MAX_BPM = 1000.0;

    /**
     * Builder for constructing tracks from document attributes
     */
    class Builder {
    public:
        Builder& setId(TrackId id) { id_ = std::move(id); return *this; }
        Builder& setGenre(std::string genre) { genre_ = std::move(genre); return *this; }
        Builder& setComments(std::string comments) { comments_ = std::move(comments); return *this; }
        Builder& setBpm(double bpm) { bpm_ = bpm; return *this; }
        Builder& setRating(int encodedRating) { encodedRating_ = encodedRating; return *this; }
        Builder& setLocation(std::string location) { location_ = std::move(location); return *this; }

        /**
         * @throws std::invalid_argument if the id is empty or the BPM is
         *         negative or not finite
         */
        Track build() const;

    private:
        TrackId id_;
        std::string genre_;
        std::string comments_;
        double bpm_{0.0};
        int encodedRating_{0};
        std::string location_;
    };

    friend class Builder;

    const TrackId& getId() const { return id_; }
    const std::string& getGenre() const { return genre_; }
    const std::string& getComments() const { return comments_; }
    double getBpm() const { return bpm_; }

    /**
     * BPM rounded to the nearest integer, ties to even.
     */
    int64_t getRoundedBpm() const;

    /**
     * The raw rating byte as stored by the document.
     */
    int getEncodedRating() const { return encodedRating_; }

    /**
     * Star rating 0-5, or std::nullopt when the byte is not canonical.
     */
    std::optional<int> getRating() const;

    const std::string& getLocation() const { return location_; }

    /**
     * Tracks without a location are playlist-membership artifacts of the
     * document, not real tracks.
     */
    bool hasLocation() const { return !location_.empty(); }

    bool operator==(const Track& other) const;
    bool operator!=(const Track& other) const { return !(*this == other); }

    std::string toString() const;

private:
    Track() = default;

    TrackId id_;
    std::string genre_;
    std::string comments_;
    double bpm_{0.0};
    int encodedRating_{0};
    std::string location_;
};

} // namespace autocrate
