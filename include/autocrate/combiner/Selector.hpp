#pragma once

#include <string>
#include <string_view>

#include "autocrate/Types.hpp"

namespace autocrate::combiner {

enum class SelectorKind {
    Tag,          // plain tag name
    Wildcard,     // tag pattern with '*'
    PlaylistRef,  // {Playlist Name}
    NumericRange  // [bpm or rating list]
};

/**
 * One operand of a Combiner expression, classified once when the token is
 * read. Playlist and numeric selectors are looked up by their literal text,
 * under which their tracks were registered ahead of evaluation.
 */
class Selector {
public:
    static constexpr char WILDCARD = '*';

    /**
     * Classify a trimmed, non-empty operand token.
     */
    static Selector parse(std::string_view token);

    SelectorKind getKind() const { return kind_; }

    /**
     * The token as written, which is also its lookup key.
     */
    const std::string& getText() const { return text_; }

    /**
     * For a PlaylistRef, the name between the braces; empty otherwise.
     */
    std::string getPlaylistName() const;

    /**
     * Track ids the selector stands for. Unknown keys give an empty set.
     */
    TrackIdSet resolve(const TagTrackIds& tracks) const;

    std::string toString() const;

private:
    Selector(SelectorKind kind, std::string text);

    TrackIdSet resolveWildcard(const TagTrackIds& tracks) const;

    SelectorKind kind_;
    std::string text_;
};

} // namespace autocrate::combiner
