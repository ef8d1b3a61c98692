#pragma once

#include <map>
#include <string>
#include <vector>

#include "autocrate/Collection.hpp"
#include "autocrate/PlaylistTree.hpp"
#include "autocrate/Types.hpp"
#include "autocrate/Util.hpp"
#include "SelectorPrescanner.hpp"

namespace autocrate::combiner {

/**
 * Union the track ids of every tag of source into target.
 */
void mergeTagTracks(TagTrackIds& target, const TagTracks& source);

/**
 * Builds playlists from boolean expressions over tags, playlists, BPMs and
 * ratings.
 *
 * Operands:
 * - tag names produced by the tag parsers, with '*' matching any run of
 *   characters ("* Techno", "Deep *")
 * - playlist names in braces, e.g. {My Favorites}
 * - ratings 0-5 and BPMs above 5 in brackets, comma separated, with ranges
 *   written low-high, e.g. [4-5] or [120-129, 140]
 *
 * Operators are '&' (intersection), '|' (union) and '~' (difference). They
 * apply left to right within one pair of parentheses, with no precedence.
 *
 * A Combiner is created per run: construction prescans the expressions and
 * the collection, playlist selectors are resolved once the tag playlists
 * exist, and then the expressions are evaluated once.
 */
class Combiner {
public:
    static constexpr const char* COMPONENT = "Combiner";

    Combiner(std::vector<std::string> expressions, const Collection& collection);

    const std::vector<std::string>& getExpressions() const { return expressions_; }

    /**
     * Register the tracks directly under every playlist named by a "{...}"
     * selector, looked up by exact name in tree first and then in fallback.
     *
     * @throws UnknownSelectorError if a name is found in neither
     */
    void resolvePlaylistSelectors(const PlaylistTree& tree, const PlaylistTree* fallback = nullptr);

    /**
     * Evaluate every expression against the given tag map merged with the
     * selector tracks. An expression that fails to parse is reported and
     * left out of the result.
     *
     * @return expression -> track ids
     */
    std::map<std::string, TrackIdSet> operator()(const TagTrackIds& tracks);

    /**
     * Evaluate one expression against the tracks accumulated so far.
     * @throws MalformedExpressionError
     */
    TrackIdSet evaluate(const std::string& expression) const;

    /**
     * Tag and selector literal -> track ids, as used for evaluation.
     */
    const TagTrackIds& getCombinerTracks() const { return tracks_; }

    const SelectorPrescanner& getPrescanner() const { return prescanner_; }

    /**
     * Prescanner diagnostics followed by this Combiner's own.
     */
    std::vector<LogEntry> getDiagnostics() const;

private:
    std::vector<std::string> expressions_;
    SelectorPrescanner prescanner_;
    TagTrackIds tracks_;
    std::vector<LogEntry> diagnostics_;
};

} // namespace autocrate::combiner
