#include "autocrate/TagStatistics.hpp"

#include "autocrate/Util.hpp"

#include <algorithm>
#include <iterator>
#include <set>

#include <fmt/format.h>

namespace autocrate {

namespace {
// Width of a label in code points, not bytes.
size_t displayWidth(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

TagStatistics::Counts toCounts(const std::map<std::string, int>& counts) {
    return TagStatistics::Counts(counts.begin(), counts.end());
}
} // namespace

std::vector<std::string> TrackTags::all() const {
    std::vector<std::string> tags = genre;
    tags.insert(tags.end(), other.begin(), other.end());
    return tags;
}

std::vector<PlaylistTagStatistics> TagStatistics::compute(const PlaylistTree& tree, NodeIndex folder,
                                                          const TrackTagMap& trackTags) {
    std::vector<PlaylistTagStatistics> result;
    for (const NodeIndex leaf : tree.leaves(folder)) {
        const auto& node = tree.getNode(leaf);
        if (node.tracks.empty()) {
            continue;
        }

        std::map<std::string, int> counts;
        std::set<std::string> genreTags;
        std::set<std::string> otherTags;
        for (const auto& trackId : node.tracks) {
            auto it = trackTags.find(trackId);
            if (it == trackTags.end()) {
                continue;
            }
            const std::set<std::string> genre(it->second.genre.begin(), it->second.genre.end());
            for (const auto& tag : it->second.all()) {
                ++counts[tag];
                if (!genre.contains(tag)) {
                    otherTags.insert(tag);
                }
            }
            genreTags.insert(genre.begin(), genre.end());
        }

        PlaylistTagStatistics statistics;
        statistics.playlist = node.name;
        for (const auto& tag : genreTags) {
            statistics.genre[tag] = counts[tag];
        }
        for (const auto& tag : otherTags) {
            statistics.other[tag] = counts[tag];
        }
        result.push_back(std::move(statistics));
    }
    return result;
}

TagStatistics::Counts TagStatistics::scale(const Counts& counts, int maximum) {
    if (counts.empty()) {
        return {};
    }
    const int largest = std::max_element(counts.begin(), counts.end(), [](const auto& a, const auto& b) {
        return a.second < b.second;
    })->second;

    Counts scaled;
    scaled.reserve(counts.size());
    for (const auto& [tag, count] : counts) {
        const double ratio = largest == 0 ? 0.0 : static_cast<double>(count) / largest;
        const int64_t height = Util::roundHalfEven(ratio * maximum);
        scaled.emplace_back(tag, static_cast<int>(std::max<int64_t>(height, 1)));
    }
    return scaled;
}

std::string TagStatistics::renderHistogram(const Counts& counts, int maximum) {
    Counts data;
    std::copy_if(counts.begin(), counts.end(), std::back_inserter(data),
                 [](const auto& entry) { return entry.second != 0; });
    if (data.empty()) {
        return {};
    }

    constexpr size_t widthPad = 1;
    const Counts scaled = scale(data, maximum);
    int row = std::max_element(scaled.begin(), scaled.end(), [](const auto& a, const auto& b) {
        return a.second < b.second;
    })->second;

    std::string output;
    size_t rowWidth = 0;
    while (row > 0) {
        output += "|";
        for (const auto& [tag, height] : scaled) {
            const auto center = static_cast<size_t>(Util::roundHalfEven(displayWidth(tag) / 2.0));
            const std::string padding(widthPad + center, ' ');
            output += padding;
            output += row <= height ? '*' : ' ';
            output += padding;
        }
        if (rowWidth == 0) {
            rowWidth = output.size();
        }
        output += "\n";
        --row;
    }

    output += std::string(rowWidth, '-') + "\n ";
    for (const auto& [tag, count] : data) {
        output += std::string(widthPad, ' ') + tag + std::string(widthPad + 1, ' ');
    }
    return output;
}

std::string TagStatistics::render(const std::vector<PlaylistTagStatistics>& statistics) {
    std::string output;
    for (const auto& playlist : statistics) {
        output += fmt::format("\n{} tag statistics:\n", playlist.playlist);
        for (const auto& [subset, counts] : {std::make_pair("Genre", &playlist.genre),
                                             std::make_pair("Other", &playlist.other)}) {
            if (counts->empty()) {
                continue;
            }
            output += fmt::format("\n{}:\n{}\n", subset, renderHistogram(toCounts(*counts)));
        }
    }
    return output;
}

} // namespace autocrate
