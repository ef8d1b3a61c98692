#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Track.hpp"

namespace autocrate {

/**
 * The fixed set of tag sources.
 */
enum class TagParserKind {
    Genre,   // delimited "Genre" field
    Comment  // "My Tags" list embedded in the comments as /* a / b */
};

/**
 * Produces the list of tags for a track. Stateless once constructed; one
 * instance is reused for every track of a run.
 */
class TagParser {
public:
    static constexpr const char* DEFAULT_GENRE_DELIMITER = "/";
    static constexpr const char* COMMENT_OPEN = "/*";
    static constexpr const char* COMMENT_CLOSE = "*/";
    static constexpr const char* COMMENT_DELIMITER = "/";
    static constexpr const char* PURE_PREFIX = "Pure ";

    /**
     * Genre parser. For each pure genre P, a track whose every genre tag
     * contains P (case-insensitively) also gets the tag "Pure P".
     *
     * @throws std::invalid_argument if the delimiter is empty
     */
    static TagParser genre(std::vector<std::string> pureGenres = {},
                           std::string delimiter = DEFAULT_GENRE_DELIMITER);

    static TagParser comment();

    /**
     * Map a configuration key ("GenreTagParser", "MyTagParser",
     * "CommentTagParser") to a parser kind.
     */
    static std::optional<TagParserKind> kindFromName(std::string_view name);

    static const char* kindName(TagParserKind kind);

    TagParserKind getKind() const { return kind_; }
    const std::vector<std::string>& getPureGenres() const { return pureGenres_; }
    const std::string& getDelimiter() const { return delimiter_; }

    std::vector<std::string> tagsFor(const Track& track) const;

    std::vector<std::string> operator()(const Track& track) const { return tagsFor(track); }

private:
    TagParser(TagParserKind kind, std::vector<std::string> pureGenres, std::string delimiter);

    std::vector<std::string> genreTags(const Track& track) const;
    std::vector<std::string> commentTags(const Track& track) const;

    TagParserKind kind_;
    std::vector<std::string> pureGenres_;
    std::string delimiter_;
};

} // namespace autocrate
