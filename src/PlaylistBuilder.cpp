#include "autocrate/PlaylistBuilder.hpp"

#include "autocrate/Errors.hpp"
#include "autocrate/TaxonomyTreeBuilder.hpp"
#include "autocrate/combiner/Combiner.hpp"

#include <fmt/format.h>

namespace autocrate {

namespace {
void appendDiagnostics(std::vector<LogEntry>& target, const std::vector<LogEntry>& source) {
    target.insert(target.end(), source.begin(), source.end());
}
} // namespace

PlaylistBuilder::PlaylistBuilder(PlaylistConfig config, BuilderSettings settings)
    : config_(std::move(config))
    , settings_(std::move(settings))
{
}

TagParser PlaylistBuilder::parserFor(TagParserKind kind) const {
    switch (kind) {
        case TagParserKind::Genre:
            return TagParser::genre(settings_.getPureGenrePlaylists(), settings_.getGenreDelimiter());
        case TagParserKind::Comment:
            return TagParser::comment();
    }
    return TagParser::comment();
}

BuildResult PlaylistBuilder::build(const Collection& collection) const {
    BuildResult result{PlaylistTree(settings_.getRootName()), std::nullopt, {}, {}, {}, {}};
    const auto& sections = config_.getSections();

    std::vector<TagParser> parsers;
    parsers.reserve(sections.size());
    for (const auto& section : sections) {
        parsers.push_back(parserFor(section.parser));
    }

    // Tag every track once per source. Entries are recorded once the
    // track's non-genre tags from every source are known.
    std::vector<TagTracks> sectionTracks(sections.size());
    collection.forEachTrack([&](const Track& track) {
        auto& trackTags = result.trackTags[track.getId()];
        std::vector<std::vector<std::string>> parsed;
        parsed.reserve(parsers.size());
        for (const auto& parser : parsers) {
            parsed.push_back(parser(track));
            auto& bucket = parser.getKind() == TagParserKind::Genre ? trackTags.genre : trackTags.other;
            for (const auto& tag : parsed.back()) {
                if (!tag.empty()) {
                    bucket.push_back(tag);
                }
            }
        }
        for (size_t i = 0; i < parsers.size(); ++i) {
            for (const auto& tag : parsed[i]) {
                if (tag.empty()) {
                    continue;
                }
                sectionTracks[i][tag].push_back(
                    TagTrackEntry{track.getId(), parsed[i], trackTags.other, track.getComments()});
            }
        }
        return true;
    });

    TagTrackIds merged;
    for (size_t i = 0; i < sections.size(); ++i) {
        combiner::mergeTagTracks(merged, sectionTracks[i]);

        TaxonomyTreeBuilder builder(result.tree, settings_.getLeafFilters());
        const auto top = builder.render(sections[i].taxonomy, PlaylistTree::ROOT);
        if (!top) {
            continue;
        }
        builder.addOther(settings_.getRemainderType(), *top, sectionTracks[i]);
        builder.addTracks(*top, sectionTracks[i]);
        result.tree.moveToFront(*top);
        appendDiagnostics(result.diagnostics, builder.getDiagnostics());
    }

    const auto& combinerSection = config_.getCombiner();
    if (!combinerSection) {
        return result;
    }

    combiner::Combiner combiner(combinerSection->expressions, collection);
    try {
        combiner.resolvePlaylistSelectors(result.tree, &collection.getPlaylists());
    } catch (const UnknownSelectorError& e) {
        appendDiagnostics(result.diagnostics, combiner.getDiagnostics());
        Util::report(result.diagnostics, LogLevel::Error, COMPONENT,
                     fmt::format("Combiner cancelled, playlist {}", e.what()));
        return result;
    }

    result.combinerPlaylists = combiner(merged);
    result.combinerTracks = combiner.getCombinerTracks();
    appendDiagnostics(result.diagnostics, combiner.getDiagnostics());

    TaxonomyTreeBuilder builder(result.tree);
    result.combinerFolder = builder.render(combinerSection->taxonomy(), PlaylistTree::ROOT);
    if (result.combinerFolder) {
        builder.addTracks(*result.combinerFolder, result.combinerPlaylists);
        result.tree.moveToFront(*result.combinerFolder);
    }
    appendDiagnostics(result.diagnostics, builder.getDiagnostics());
    return result;
}

std::vector<PlaylistTagStatistics> PlaylistBuilder::combinerStatistics(const BuildResult& result) {
    if (!result.combinerFolder) {
        return {};
    }
    return TagStatistics::compute(result.tree, *result.combinerFolder, result.trackTags);
}

} // namespace autocrate
