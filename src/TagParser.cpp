#include "autocrate/TagParser.hpp"

#include "autocrate/Util.hpp"

#include <algorithm>
#include <stdexcept>

namespace autocrate {

TagParser::TagParser(TagParserKind kind, std::vector<std::string> pureGenres, std::string delimiter)
    : kind_(kind)
    , pureGenres_(std::move(pureGenres))
    , delimiter_(std::move(delimiter))
{
}

TagParser TagParser::genre(std::vector<std::string> pureGenres, std::string delimiter) {
    if (delimiter.empty()) {
        throw std::invalid_argument("Genre delimiter must not be empty");
    }
    return TagParser(TagParserKind::Genre, std::move(pureGenres), std::move(delimiter));
}

TagParser TagParser::comment() {
    return TagParser(TagParserKind::Comment, {}, COMMENT_DELIMITER);
}

std::optional<TagParserKind> TagParser::kindFromName(std::string_view name) {
    if (name == "GenreTagParser") {
        return TagParserKind::Genre;
    }
    if (name == "MyTagParser" || name == "CommentTagParser") {
        return TagParserKind::Comment;
    }
    return std::nullopt;
}

const char* TagParser::kindName(TagParserKind kind) {
    switch (kind) {
        case TagParserKind::Genre:   return "GenreTagParser";
        case TagParserKind::Comment: return "MyTagParser";
    }
    return "unknown";
}

std::vector<std::string> TagParser::tagsFor(const Track& track) const {
    switch (kind_) {
        case TagParserKind::Genre:
            return genreTags(track);
        case TagParserKind::Comment:
            return commentTags(track);
    }
    return {};
}

std::vector<std::string> TagParser::genreTags(const Track& track) const {
    std::vector<std::string> tags;
    for (const auto& part : Util::split(track.getGenre(), delimiter_)) {
        tags.push_back(Util::trim(part));
    }

    for (const auto& pure : pureGenres_) {
        const bool allMatch = std::all_of(tags.begin(), tags.end(), [&pure](const std::string& tag) {
            return Util::containsIgnoreCase(tag, pure);
        });
        if (allMatch) {
            tags.push_back(PURE_PREFIX + pure);
        }
    }
    return tags;
}

std::vector<std::string> TagParser::commentTags(const Track& track) const {
    const std::string_view comments = track.getComments();

    // The first opening marker that has a closing marker after it on the same
    // line wins; the span runs to the last closing marker of that line.
    std::optional<std::string_view> span;
    size_t open = comments.find(COMMENT_OPEN);
    while (open != std::string_view::npos && !span) {
        const size_t start = open + 2;
        const size_t lineEnd = std::min(comments.find('\n', start), comments.size());
        const std::string_view line = comments.substr(start, lineEnd - start);
        const size_t close = line.rfind(COMMENT_CLOSE);
        if (close != std::string_view::npos) {
            span = line.substr(0, close);
        }
        open = comments.find(COMMENT_OPEN, open + 1);
    }
    if (!span) {
        return {};
    }

    std::vector<std::string> tags;
    for (const auto& part : Util::split(*span, COMMENT_DELIMITER)) {
        tags.push_back(Util::trim(part));
    }
    return tags;
}

} // namespace autocrate
