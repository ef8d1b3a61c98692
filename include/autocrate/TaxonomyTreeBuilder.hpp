#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "LeafFilter.hpp"
#include "PlaylistTree.hpp"
#include "Taxonomy.hpp"
#include "Types.hpp"
#include "Util.hpp"

namespace autocrate {

/**
 * Turns a taxonomy into folders and playlists of a PlaylistTree and fills
 * the playlists from a tag -> tracks map.
 *
 * Every folder below the top level gets a leading "All <folder>" playlist
 * that aggregates the tracks of everything beneath it. Insertion is
 * idempotent per (folder, playlist) pair for the lifetime of the builder.
 */
class TaxonomyTreeBuilder {
public:
    static constexpr const char* COMPONENT = "TaxonomyTreeBuilder";
    static constexpr const char* ALL_PREFIX = "All ";
    static constexpr const char* OTHER_NAME = "Other";

    /**
     * @param tree output tree, must outlive the builder
     * @param filters leaf disambiguation rules; the first rule that applies
     *        to a leaf decides for it
     */
    explicit TaxonomyTreeBuilder(PlaylistTree& tree, std::vector<LeafFilter> filters = {});

    /**
     * Render a taxonomy as the last child of parent.
     *
     * @param topLevel suppresses the "All" playlist of the rendered folder
     * @return the created node, or std::nullopt for an "_ignore" folder
     */
    std::optional<NodeIndex> render(const TaxonomyNode& taxonomy, NodeIndex parent, bool topLevel = true);

    /**
     * Create the remainder bucket under top for tags that no rendered
     * taxonomy declares. In "playlist" mode the tracks of every leftover tag
     * are also registered under "Other" in tracks so addTracks fills it.
     *
     * @param remainderType "folder", "playlist" or empty; anything else is
     *        reported and ignored
     * @return the created "Other" node
     */
    std::optional<NodeIndex> addOther(std::string_view remainderType, NodeIndex top, TagTracks& tracks);

    /**
     * Insert tracks into every playlist under top whose name is a tag of the
     * map, applying the leaf rules, and into the "All" playlists above it.
     */
    void addTracks(NodeIndex top, const TagTracks& tracks);

    /**
     * Insert plain track sets (no tag lists, so no leaf rules) in ascending
     * id order.
     */
    void addTracks(NodeIndex top, const TagTrackIds& tracks);

    /**
     * Tag names declared by the rendered taxonomies, "_ignore" entries
     * included.
     */
    const std::set<std::string>& getKnownTags() const { return knownTags_; }

    bool isAggregate(NodeIndex node) const { return aggregates_.contains(node); }

    const std::vector<LogEntry>& getDiagnostics() const { return diagnostics_; }

private:
    void registerIgnored(const TaxonomyNode& ignored);
    const LeafFilter* filterFor(NodeIndex leaf) const;
    void insert(NodeIndex leaf, const TrackId& trackId);
    void appendOnce(NodeIndex leaf, const TrackId& trackId);
    void reportEmptyLeaves(NodeIndex top);

    PlaylistTree& tree_;
    std::vector<LeafFilter> filters_;
    std::set<std::string> knownTags_;
    std::set<NodeIndex> aggregates_;
    std::map<std::pair<NodeIndex, NodeIndex>, TrackIdSet> seen_;
    std::vector<LogEntry> diagnostics_;
};

} // namespace autocrate
