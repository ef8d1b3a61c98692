#include "autocrate/BuilderSettings.hpp"

#include <stdexcept>

namespace autocrate {

BuilderSettings::BuilderSettings()
    : leafFilters_{LeafFilter::hipHop()}
{
}

BuilderSettings& BuilderSettings::setPureGenrePlaylists(std::vector<std::string> genres) {
    pureGenrePlaylists_ = std::move(genres);
    return *this;
}

BuilderSettings& BuilderSettings::setGenreDelimiter(std::string delimiter) {
    if (delimiter.empty()) {
        throw std::invalid_argument("Genre delimiter must not be empty");
    }
    genreDelimiter_ = std::move(delimiter);
    return *this;
}

BuilderSettings& BuilderSettings::setRootName(std::string name) {
    if (name.empty()) {
        throw std::invalid_argument("Root folder name must not be empty");
    }
    rootName_ = std::move(name);
    return *this;
}

} // namespace autocrate
