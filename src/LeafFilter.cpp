#include "autocrate/LeafFilter.hpp"

#include "autocrate/Errors.hpp"
#include "autocrate/Util.hpp"

#include <algorithm>
#include <charconv>
#include <iterator>
#include <regex>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace autocrate {

namespace {
bool isHipHopComponent(const std::string& tag) {
    return std::any_of(std::begin(LeafFilter::HIP_HOP_TOKENS), std::end(LeafFilter::HIP_HOP_TOKENS),
                       [&tag](const char* token) { return Util::containsIgnoreCase(tag, token); });
}

/**
 * True if the leaf or one of its ancestors has marker in its name.
 */
bool markedOnPath(const PlaylistTree& tree, NodeIndex leaf, const char* marker) {
    for (std::optional<NodeIndex> node = leaf; node; node = tree.getNode(*node).parent) {
        if (Util::containsIgnoreCase(tree.getNode(*node).name, marker)) {
            return true;
        }
    }
    return false;
}

bool isNumber(std::string_view token) {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
    }
    if (token.empty()) {
        return false;
    }
    double value = 0.0;
    const auto [end, error] = std::from_chars(token.data(), token.data() + token.size(), value);
    return error == std::errc() && end == token.data() + token.size();
}
} // namespace

LeafFilter::LeafFilter(LeafFilterKind kind, std::string leafName, std::string folderName, std::string prefixTag)
    : kind_(kind)
    , leafName_(std::move(leafName))
    , folderName_(std::move(folderName))
    , prefixTag_(std::move(prefixTag))
{
}

const std::set<std::string>& LeafFilter::defaultComplexExcludes() {
    static const std::set<std::string> excludes = {
        "DELETE", "Flute", "Guitar", "Horn", "Piano", "Scratch", "Strings", "Vocal",
    };
    return excludes;
}

LeafFilter LeafFilter::hipHop(std::string pureParentName, std::string leafName) {
    return LeafFilter(LeafFilterKind::HipHop, std::move(leafName), std::move(pureParentName), "");
}

LeafFilter LeafFilter::minimalDeepTech(std::string anchorFolder, std::string leafName, std::string prefixTag) {
    return LeafFilter(LeafFilterKind::MinimalDeepTech, std::move(leafName), std::move(anchorFolder),
                      std::move(prefixTag));
}

LeafFilter LeafFilter::complex(int minTags, std::set<std::string> excludes) {
    if (minTags < 0) {
        throw std::invalid_argument(fmt::format("Minimum tag count must not be negative: {}", minTags));
    }
    LeafFilter filter(LeafFilterKind::Complex, "", "", "");
    filter.minTags_ = minTags;
    filter.excludes_ = std::move(excludes);
    return filter;
}

LeafFilter LeafFilter::transition(std::string separator) {
    if (separator.empty()) {
        throw std::invalid_argument("Transition separator must not be empty");
    }
    LeafFilter filter(LeafFilterKind::Transition, "", "", "");
    filter.separator_ = std::move(separator);
    return filter;
}

std::optional<TransitionType> LeafFilter::transitionType(const std::string& leafName) {
    const bool genre = Util::containsIgnoreCase(leafName, GENRE_MARKER);
    const bool tempo = Util::containsIgnoreCase(leafName, TEMPO_MARKER);
    if (genre && tempo) {
        throw InvalidTaxonomyError(
            fmt::format("\"{}\" matches multiple playlist types: {}, {}", leafName, GENRE_MARKER, TEMPO_MARKER));
    }
    if (genre) {
        return TransitionType::Genre;
    }
    if (tempo) {
        return TransitionType::Tempo;
    }
    return std::nullopt;
}

bool LeafFilter::appliesTo(const PlaylistTree& tree, NodeIndex leaf) const {
    const auto& node = tree.getNode(leaf);
    if (node.isFolder()) {
        return false;
    }
    switch (kind_) {
        case LeafFilterKind::HipHop:
        case LeafFilterKind::MinimalDeepTech:
            return node.name == leafName_;
        case LeafFilterKind::Complex:
            return markedOnPath(tree, leaf, COMPLEX_MARKER);
        case LeafFilterKind::Transition:
            return markedOnPath(tree, leaf, TRANSITION_MARKER) && transitionType(node.name).has_value();
    }
    return false;
}

bool LeafFilter::accepts(const PlaylistTree& tree, NodeIndex leaf, const TagTrackEntry& entry) const {
    switch (kind_) {
        case LeafFilterKind::HipHop:
            return acceptsHipHop(tree, leaf, entry.tags);
        case LeafFilterKind::MinimalDeepTech:
            return acceptsMinimalDeepTech(tree, leaf, entry.tags);
        case LeafFilterKind::Complex:
            return acceptsComplex(entry);
        case LeafFilterKind::Transition:
            return acceptsTransition(tree, leaf, entry.comments);
    }
    return true;
}

bool LeafFilter::acceptsHipHop(const PlaylistTree& tree, NodeIndex leaf, const std::vector<std::string>& tags) const {
    const auto& parent = tree.getNode(leaf).parent;
    const bool pure = parent && tree.getNode(*parent).name == folderName_;
    if (pure) {
        return std::all_of(tags.begin(), tags.end(), isHipHopComponent);
    }
    return !std::all_of(tags.begin(), tags.end(), isHipHopComponent);
}

bool LeafFilter::acceptsMinimalDeepTech(const PlaylistTree& tree, NodeIndex leaf,
                                        const std::vector<std::string>& tags) const {
    bool anchored = false;
    for (auto parent = tree.getNode(leaf).parent; parent; parent = tree.getNode(*parent).parent) {
        if (tree.getNode(*parent).name == folderName_) {
            anchored = true;
            break;
        }
    }

    bool prefixed = false;
    const auto position = std::find(tags.begin(), tags.end(), leafName_);
    if (position != tags.end() && position != tags.begin()) {
        prefixed = Util::equalsIgnoreCase(*(position - 1), prefixTag_);
    }
    return anchored == prefixed;
}

bool LeafFilter::acceptsComplex(const TagTrackEntry& entry) const {
    std::set<std::string> counted;
    for (const auto& tag : entry.otherTags) {
        if (!excludes_.contains(tag)) {
            counted.insert(tag);
        }
    }
    return !counted.empty() && counted.size() >= static_cast<size_t>(minTags_);
}

bool LeafFilter::acceptsTransition(const PlaylistTree& tree, NodeIndex leaf, const std::string& comments) const {
    static const std::regex TOKENS(R"(\[([^\]]+)\])");

    const auto type = transitionType(tree.getNode(leaf).name);
    if (!type) {
        return false;
    }

    for (auto it = std::sregex_iterator(comments.begin(), comments.end(), TOKENS);
         it != std::sregex_iterator(); ++it) {
        const auto tokens = Util::split((*it)[1].str(), separator_);
        const bool numeric = std::all_of(tokens.begin(), tokens.end(),
                                         [](const std::string& token) { return isNumber(Util::trim(token)); });
        if (numeric == (*type == TransitionType::Tempo)) {
            return true;
        }
    }
    return false;
}

std::string LeafFilter::toString() const {
    switch (kind_) {
        case LeafFilterKind::HipHop:
            return fmt::format("HipHop[leaf:{}, pureParent:{}]", leafName_, folderName_);
        case LeafFilterKind::MinimalDeepTech:
            return fmt::format("MinimalDeepTech[leaf:{}, anchor:{}, prefix:{}]", leafName_, folderName_, prefixTag_);
        case LeafFilterKind::Complex:
            return fmt::format("Complex[minTags:{}, excludes:{}]", minTags_, fmt::join(excludes_, ","));
        case LeafFilterKind::Transition:
            return fmt::format("Transition[separator:{}]", separator_);
    }
    return "LeafFilter[]";
}

} // namespace autocrate
