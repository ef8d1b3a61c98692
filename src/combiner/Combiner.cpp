#include "autocrate/combiner/Combiner.hpp"

#include "autocrate/Errors.hpp"
#include "autocrate/combiner/BooleanNode.hpp"

#include <fmt/format.h>

namespace autocrate::combiner {

void mergeTagTracks(TagTrackIds& target, const TagTracks& source) {
    for (const auto& [tag, entries] : source) {
        auto& ids = target[tag];
        for (const auto& entry : entries) {
            ids.insert(entry.trackId);
        }
    }
}

Combiner::Combiner(std::vector<std::string> expressions, const Collection& collection)
    : expressions_(std::move(expressions))
    , prescanner_(expressions_)
{
    prescanner_.scan(collection, tracks_);
}

void Combiner::resolvePlaylistSelectors(const PlaylistTree& tree, const PlaylistTree* fallback) {
    for (const auto& name : prescanner_.getPlaylistNames()) {
        const PlaylistTree* owner = &tree;
        auto node = tree.findByName(name);
        if (!node && fallback != nullptr) {
            owner = fallback;
            node = fallback->findByName(name);
        }
        if (!node) {
            throw UnknownSelectorError(fmt::format("{} not found", name));
        }
        const auto& ids = owner->trackIds(*node);
        tracks_["{" + name + "}"] = TrackIdSet(ids.begin(), ids.end());
    }
}

std::map<std::string, TrackIdSet> Combiner::operator()(const TagTrackIds& tracks) {
    for (const auto& [tag, ids] : tracks) {
        tracks_[tag].insert(ids.begin(), ids.end());
    }

    std::map<std::string, TrackIdSet> playlists;
    for (const auto& expression : expressions_) {
        try {
            playlists[expression] = evaluate(expression);
        } catch (const MalformedExpressionError& e) {
            Util::report(diagnostics_, LogLevel::Error, COMPONENT,
                         fmt::format("Skipping \"{}\": {}", expression, e.what()));
        }
    }
    return playlists;
}

TrackIdSet Combiner::evaluate(const std::string& expression) const {
    return BooleanExpression(expression).evaluate(tracks_);
}

std::vector<LogEntry> Combiner::getDiagnostics() const {
    std::vector<LogEntry> entries = prescanner_.getDiagnostics();
    entries.insert(entries.end(), diagnostics_.begin(), diagnostics_.end());
    return entries;
}

} // namespace autocrate::combiner
