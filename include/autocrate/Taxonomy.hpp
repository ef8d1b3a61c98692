#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "TagParser.hpp"

namespace autocrate {

/**
 * Declarative folder/playlist layout for one tag source. A leaf is a bare
 * tag string; a folder has a name and ordered children.
 */
class TaxonomyNode {
public:
    /**
     * Folder name whose children are registered as known tags without
     * producing any playlist.
     */
    static constexpr const char* IGNORE_FOLDER = "_ignore";

    static TaxonomyNode playlist(std::string tag);
    static TaxonomyNode folder(std::string name, std::vector<TaxonomyNode> children);

    /**
     * Validate a configuration document into a taxonomy. Strings become
     * leaves, {name, playlists} objects (keys case-insensitive) become
     * folders.
     *
     * @throws InvalidTaxonomyError for anything else
     */
    static TaxonomyNode fromValue(const nlohmann::ordered_json& value);

    bool isFolder() const { return folder_; }
    const std::string& getName() const { return name_; }
    const std::vector<TaxonomyNode>& getChildren() const { return children_; }

    bool isIgnoreMarker() const { return folder_ && name_ == IGNORE_FOLDER; }

    std::string toString() const;

private:
    TaxonomyNode(std::string name, bool folder, std::vector<TaxonomyNode> children);

    std::string name_;
    bool folder_{false};
    std::vector<TaxonomyNode> children_;
};

/**
 * One tag source paired with the taxonomy its tags are organized into.
 */
struct TaxonomySection {
    TagParserKind parser;
    TaxonomyNode taxonomy;
};

/**
 * The flat list of boolean expressions, each of which becomes one playlist
 * named after the expression.
 */
struct CombinerSection {
    static constexpr const char* DEFAULT_NAME = "Combiner";

    std::string name{DEFAULT_NAME};
    std::vector<std::string> expressions;

    /**
     * The section as a one-level taxonomy.
     */
    TaxonomyNode taxonomy() const;
};

/**
 * Validated playlist configuration: tag sections in document order plus the
 * optional Combiner section.
 */
class PlaylistConfig {
public:
    static constexpr const char* COMBINER_KEY = "Combiner";

    PlaylistConfig() = default;

    /**
     * @param value top-level object keyed by "GenreTagParser", "MyTagParser"
     *        (or "CommentTagParser") and "Combiner"; null means empty
     * @throws InvalidTaxonomyError on unknown or repeated keys and on invalid
     *         taxonomies
     */
    static PlaylistConfig fromValue(const nlohmann::ordered_json& value);

    PlaylistConfig& addSection(TagParserKind parser, TaxonomyNode taxonomy);
    PlaylistConfig& setCombiner(CombinerSection combiner);

    const std::vector<TaxonomySection>& getSections() const { return sections_; }
    const std::optional<CombinerSection>& getCombiner() const { return combiner_; }

private:
    std::vector<TaxonomySection> sections_;
    std::optional<CombinerSection> combiner_;
};

} // namespace autocrate
