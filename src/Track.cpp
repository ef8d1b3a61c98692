#include "autocrate/Track.hpp"

#include "autocrate/Util.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

namespace autocrate {

Track Track::Builder::build() const {
    if (id_.empty()) {
        throw std::invalid_argument("Track id must not be empty");
    }
    if (!std::isfinite(bpm_) || bpm_ < 0.0 || bpm_ > MAX_BPM) {
        throw std::invalid_argument(fmt::format("Track {} has an invalid BPM: {}", id_, bpm_));
    }

    Track track;
    track.id_ = id_;
    track.genre_ = genre_;
    track.comments_ = comments_;
    track.bpm_ = bpm_;
    track.encodedRating_ = encodedRating_;
    track.location_ = location_;
    return track;
}

int64_t Track::getRoundedBpm() const {
    return Util::roundHalfEven(bpm_);
}

std::optional<int> Track::getRating() const {
    return Util::decodeRating(encodedRating_);
}

bool Track::operator==(const Track& other) const {
    return id_ == other.id_ &&
           genre_ == other.genre_ &&
           comments_ == other.comments_ &&
           bpm_ == other.bpm_ &&
           encodedRating_ == other.encodedRating_ &&
           location_ == other.location_;
}

std::string Track::toString() const {
    return fmt::format("Track[id:{}, genre:{}, bpm:{:.2f}, rating:{}]",
                       id_, genre_, bpm_, encodedRating_);
}

} // namespace autocrate
