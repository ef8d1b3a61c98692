#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "BuilderSettings.hpp"
#include "Collection.hpp"
#include "PlaylistTree.hpp"
#include "TagParser.hpp"
#include "TagStatistics.hpp"
#include "Taxonomy.hpp"
#include "Types.hpp"
#include "Util.hpp"

namespace autocrate {

/**
 * Everything a build produced. The tree is new for every build and holds
 * only generated playlists.
 */
struct BuildResult {
    PlaylistTree tree;
    std::optional<NodeIndex> combinerFolder;
    std::map<std::string, TrackIdSet> combinerPlaylists;
    TagTrackIds combinerTracks;
    TrackTagMap trackTags;
    std::vector<LogEntry> diagnostics;
};

/**
 * Generates the playlist tree of a collection from tags.
 *
 * Each configured tag source tags every track; its taxonomy is rendered
 * under the root, optionally completed by a remainder bucket, and filled.
 * The Combiner section, if any, then evaluates its expressions over the
 * union of all tag maps. Each finished section is placed first under the
 * root, so the Combiner folder ends up first and the tag sections follow in
 * reverse configuration order.
 */
class PlaylistBuilder {
public:
    static constexpr const char* COMPONENT = "PlaylistBuilder";

    explicit PlaylistBuilder(PlaylistConfig config, BuilderSettings settings = BuilderSettings());

    const PlaylistConfig& getConfig() const { return config_; }
    const BuilderSettings& getSettings() const { return settings_; }

    /**
     * Run a build. A "{...}" selector that names no playlist, either in the
     * generated tree or among the collection's playlists, is reported and
     * cancels the Combiner section only.
     */
    BuildResult build(const Collection& collection) const;

    /**
     * Tag statistics of the Combiner playlists of a build.
     */
    static std::vector<PlaylistTagStatistics> combinerStatistics(const BuildResult& result);

private:
    TagParser parserFor(TagParserKind kind) const;

    PlaylistConfig config_;
    BuilderSettings settings_;
};

} // namespace autocrate
