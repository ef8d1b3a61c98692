#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "PlaylistTree.hpp"
#include "Types.hpp"

namespace autocrate {

enum class LeafFilterKind {
    HipHop,
    MinimalDeepTech,
    Complex,
    Transition
};

/**
 * Kind of transition a "transition" playlist collects, read from its name.
 */
enum class TransitionType {
    Genre,
    Tempo
};

/**
 * Disambiguation rule for taxonomy leaves whose name appears in more than one
 * place with different meanings, or whose name asks for tracks of a certain
 * shape. A rule only ever applies to the leaf a track is inserted into, never
 * to the "All" aggregation leaves above it.
 */
class LeafFilter {
public:
    static constexpr const char* HIP_HOP_LEAF = "Hip Hop";
    static constexpr const char* GENRES_FOLDER = "Genres";
    static constexpr const char* MINIMAL_DEEP_TECH_LEAF = "Minimal Deep Tech";
    static constexpr const char* TECHNO_FOLDER = "Techno";
    static constexpr const char* TECHNO_TAG = "techno";
    static constexpr const char* COMPLEX_MARKER = "complex";
    static constexpr const char* TRANSITION_MARKER = "transition";
    static constexpr const char* GENRE_MARKER = "genre";
    static constexpr const char* TEMPO_MARKER = "tempo";
    static constexpr const char* DEFAULT_TRANSITION_SEPARATOR = "/";
    static constexpr int DEFAULT_MIN_COMPLEX_TAGS = 3;

    /**
     * Tags that make up "traditional" hip hop.
     */
    static constexpr const char* HIP_HOP_TOKENS[] = {"r&b", "hip hop"};

    /**
     * Tags that never count towards a complex track.
     */
    static const std::set<std::string>& defaultComplexExcludes();

    /**
     * A leaf directly under pureParentName keeps only tracks whose every tag
     * contains "r&b" or "hip hop"; a leaf of the same name anywhere else keeps
     * only tracks with at least one tag containing neither.
     */
    static LeafFilter hipHop(std::string pureParentName = GENRES_FOLDER,
                             std::string leafName = HIP_HOP_LEAF);

    /**
     * Under an anchorFolder ancestor a leaf keeps only tracks whose tag just
     * before the leaf tag is prefixTag; elsewhere it keeps only tracks whose
     * preceding tag is not.
     */
    static LeafFilter minimalDeepTech(std::string anchorFolder = TECHNO_FOLDER,
                                      std::string leafName = MINIMAL_DEEP_TECH_LEAF,
                                      std::string prefixTag = TECHNO_TAG);

    /**
     * A leaf with "complex" in its own or an ancestor's name keeps only
     * tracks with at least minTags distinct non-genre tags outside excludes.
     */
    static LeafFilter complex(int minTags = DEFAULT_MIN_COMPLEX_TAGS,
                              std::set<std::string> excludes = defaultComplexExcludes());

    /**
     * A leaf with "transition" in its own or an ancestor's name, and exactly
     * one of "genre" or "tempo" in its own name, keeps only tracks whose
     * comments hold a "[a / b]" token list of that type: all numbers for
     * tempo, anything else for genre.
     */
    static LeafFilter transition(std::string separator = DEFAULT_TRANSITION_SEPARATOR);

    LeafFilterKind getKind() const { return kind_; }
    const std::string& getLeafName() const { return leafName_; }
    const std::string& getFolderName() const { return folderName_; }
    int getMinTags() const { return minTags_; }
    const std::set<std::string>& getExcludes() const { return excludes_; }
    const std::string& getSeparator() const { return separator_; }

    /**
     * @throws InvalidTaxonomyError for a transition leaf whose name names
     *         both transition types
     */
    bool appliesTo(const PlaylistTree& tree, NodeIndex leaf) const;

    /**
     * Decide whether a track belongs in the leaf. Only meaningful when
     * appliesTo(tree, leaf) is true.
     */
    bool accepts(const PlaylistTree& tree, NodeIndex leaf, const TagTrackEntry& entry) const;

    /**
     * Transition type named by a leaf, if any.
     *
     * @throws InvalidTaxonomyError when the name contains both markers
     */
    static std::optional<TransitionType> transitionType(const std::string& leafName);

    std::string toString() const;

private:
    LeafFilter(LeafFilterKind kind, std::string leafName, std::string folderName, std::string prefixTag);

    bool acceptsHipHop(const PlaylistTree& tree, NodeIndex leaf, const std::vector<std::string>& tags) const;
    bool acceptsMinimalDeepTech(const PlaylistTree& tree, NodeIndex leaf,
                                const std::vector<std::string>& tags) const;
    bool acceptsComplex(const TagTrackEntry& entry) const;
    bool acceptsTransition(const PlaylistTree& tree, NodeIndex leaf, const std::string& comments) const;

    LeafFilterKind kind_;
    std::string leafName_;
    std::string folderName_;
    std::string prefixTag_;
    int minTags_{0};
    std::set<std::string> excludes_;
    std::string separator_;
};

} // namespace autocrate
