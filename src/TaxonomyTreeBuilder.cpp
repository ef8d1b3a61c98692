#include "autocrate/TaxonomyTreeBuilder.hpp"

#include "autocrate/BuilderSettings.hpp"
#include "autocrate/Errors.hpp"

#include <fmt/format.h>

namespace autocrate {

TaxonomyTreeBuilder::TaxonomyTreeBuilder(PlaylistTree& tree, std::vector<LeafFilter> filters)
    : tree_(tree)
    , filters_(std::move(filters))
{
}

std::optional<NodeIndex> TaxonomyTreeBuilder::render(const TaxonomyNode& taxonomy, NodeIndex parent, bool topLevel) {
    if (!taxonomy.isFolder()) {
        knownTags_.insert(taxonomy.getName());
        return tree_.addPlaylist(parent, taxonomy.getName());
    }

    if (taxonomy.isIgnoreMarker()) {
        registerIgnored(taxonomy);
        return std::nullopt;
    }

    const NodeIndex folder = tree_.addFolder(parent, taxonomy.getName());
    if (!topLevel) {
        aggregates_.insert(tree_.addPlaylist(folder, ALL_PREFIX + taxonomy.getName()));
    }
    for (const auto& child : taxonomy.getChildren()) {
        render(child, folder, false);
    }
    return folder;
}

void TaxonomyTreeBuilder::registerIgnored(const TaxonomyNode& ignored) {
    for (const auto& child : ignored.getChildren()) {
        if (child.isFolder()) {
            registerIgnored(child);
        } else {
            knownTags_.insert(child.getName());
        }
    }
}

std::optional<NodeIndex> TaxonomyTreeBuilder::addOther(std::string_view remainderType, NodeIndex top,
                                                       TagTracks& tracks) {
    if (remainderType.empty()) {
        return std::nullopt;
    }

    if (remainderType == BuilderSettings::REMAINDER_FOLDER) {
        const NodeIndex folder = tree_.addFolder(top, OTHER_NAME);
        for (const auto& [tag, entries] : tracks) {
            if (!knownTags_.contains(tag)) {
                tree_.addPlaylist(folder, tag);
            }
        }
        return folder;
    }

    if (remainderType == BuilderSettings::REMAINDER_PLAYLIST) {
        const NodeIndex playlist = tree_.addPlaylist(top, OTHER_NAME);
        std::vector<TagTrackEntry> leftovers;
        for (const auto& [tag, entries] : tracks) {
            if (tag != OTHER_NAME && !knownTags_.contains(tag)) {
                leftovers.insert(leftovers.end(), entries.begin(), entries.end());
            }
        }
        auto& other = tracks[OTHER_NAME];
        other.insert(other.end(), leftovers.begin(), leftovers.end());
        return playlist;
    }

    Util::report(diagnostics_, LogLevel::Error, COMPONENT,
                 fmt::format("Invalid remainder type \"{}\"", remainderType));
    return std::nullopt;
}

const LeafFilter* TaxonomyTreeBuilder::filterFor(NodeIndex leaf) const {
    for (const auto& filter : filters_) {
        if (filter.appliesTo(tree_, leaf)) {
            return &filter;
        }
    }
    return nullptr;
}

void TaxonomyTreeBuilder::appendOnce(NodeIndex leaf, const TrackId& trackId) {
    const NodeIndex parent = *tree_.getNode(leaf).parent;
    if (seen_[{parent, leaf}].insert(trackId).second) {
        tree_.appendTrack(leaf, trackId);
    }
}

void TaxonomyTreeBuilder::insert(NodeIndex leaf, const TrackId& trackId) {
    appendOnce(leaf, trackId);

    // Climb while each folder owns an "All <folder>" playlist.
    auto folder = tree_.getNode(leaf).parent;
    while (folder) {
        const auto aggregate = tree_.childNamed(*folder, ALL_PREFIX + tree_.getNode(*folder).name);
        if (!aggregate) {
            break;
        }
        appendOnce(*aggregate, trackId);
        folder = tree_.getNode(*folder).parent;
    }
}

void TaxonomyTreeBuilder::addTracks(NodeIndex top, const TagTracks& tracks) {
    for (const NodeIndex leaf : tree_.leaves(top)) {
        auto it = tracks.find(tree_.getNode(leaf).name);
        if (it == tracks.end()) {
            continue;
        }
        const LeafFilter* filter = nullptr;
        try {
            filter = filterFor(leaf);
        } catch (const InvalidTaxonomyError& e) {
            Util::report(diagnostics_, LogLevel::Error, COMPONENT,
                         fmt::format("Skipping \"{}\": {}", tree_.path(leaf), e.what()));
            continue;
        }
        for (const auto& entry : it->second) {
            if (filter != nullptr && !filter->accepts(tree_, leaf, entry)) {
                continue;
            }
            insert(leaf, entry.trackId);
        }
    }
    reportEmptyLeaves(top);
}

void TaxonomyTreeBuilder::addTracks(NodeIndex top, const TagTrackIds& tracks) {
    for (const NodeIndex leaf : tree_.leaves(top)) {
        auto it = tracks.find(tree_.getNode(leaf).name);
        if (it == tracks.end()) {
            continue;
        }
        for (const auto& trackId : it->second) {
            insert(leaf, trackId);
        }
    }
    reportEmptyLeaves(top);
}

void TaxonomyTreeBuilder::reportEmptyLeaves(NodeIndex top) {
    for (const NodeIndex leaf : tree_.leaves(top)) {
        const auto& node = tree_.getNode(leaf);
        if (node.tracks.empty() && !aggregates_.contains(leaf)) {
            Util::report(diagnostics_, LogLevel::Warning, COMPONENT,
                         fmt::format("Playlist \"{}\" received no tracks", tree_.path(leaf)));
        }
    }
}

} // namespace autocrate
