#include "autocrate/combiner/Selector.hpp"

#include "autocrate/Util.hpp"

#include <regex>

#include <fmt/format.h>

namespace autocrate::combiner {

namespace {
bool isWrapped(std::string_view token, char open, char close) {
    return token.size() >= 2 && token.front() == open && token.back() == close;
}

std::string escapeRegex(std::string_view text) {
    static constexpr std::string_view SPECIAL = R"(\^$.|?*+()[]{})";
    std::string escaped;
    escaped.reserve(text.size());
    for (const char c : text) {
        if (SPECIAL.find(c) != std::string_view::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

const char* kindName(SelectorKind kind) {
    switch (kind) {
        case SelectorKind::Tag:          return "Tag";
        case SelectorKind::Wildcard:     return "Wildcard";
        case SelectorKind::PlaylistRef:  return "PlaylistRef";
        case SelectorKind::NumericRange: return "NumericRange";
    }
    return "Unknown";
}
} // namespace

Selector::Selector(SelectorKind kind, std::string text)
    : kind_(kind)
    , text_(std::move(text))
{
}

Selector Selector::parse(std::string_view token) {
    if (token.find(WILDCARD) != std::string_view::npos) {
        return Selector(SelectorKind::Wildcard, std::string(token));
    }
    if (isWrapped(token, '{', '}')) {
        return Selector(SelectorKind::PlaylistRef, std::string(token));
    }
    if (isWrapped(token, '[', ']')) {
        return Selector(SelectorKind::NumericRange, std::string(token));
    }
    return Selector(SelectorKind::Tag, std::string(token));
}

std::string Selector::getPlaylistName() const {
    if (kind_ != SelectorKind::PlaylistRef) {
        return {};
    }
    return text_.substr(1, text_.size() - 2);
}

TrackIdSet Selector::resolve(const TagTrackIds& tracks) const {
    if (kind_ == SelectorKind::Wildcard) {
        return resolveWildcard(tracks);
    }
    auto it = tracks.find(text_);
    if (it == tracks.end()) {
        return {};
    }
    return it->second;
}

TrackIdSet Selector::resolveWildcard(const TagTrackIds& tracks) const {
    std::string pattern;
    const auto parts = Util::split(text_, std::string_view(&WILDCARD, 1));
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            pattern += ".*";
        }
        pattern += escapeRegex(parts[i]);
    }

    const std::regex expression(pattern);
    TrackIdSet result;
    for (const auto& [tag, ids] : tracks) {
        if (std::regex_search(tag, expression)) {
            result.insert(ids.begin(), ids.end());
        }
    }
    return result;
}

std::string Selector::toString() const {
    return fmt::format("{}[{}]", kindName(kind_), text_);
}

} // namespace autocrate::combiner
