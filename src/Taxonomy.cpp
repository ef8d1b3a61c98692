#include "autocrate/Taxonomy.hpp"

#include "autocrate/Errors.hpp"
#include "autocrate/Util.hpp"

#include <algorithm>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace autocrate {

TaxonomyNode::TaxonomyNode(std::string name, bool folder, std::vector<TaxonomyNode> children)
    : name_(std::move(name))
    , folder_(folder)
    , children_(std::move(children))
{
}

TaxonomyNode TaxonomyNode::playlist(std::string tag) {
    return TaxonomyNode(std::move(tag), false, {});
}

TaxonomyNode TaxonomyNode::folder(std::string name, std::vector<TaxonomyNode> children) {
    return TaxonomyNode(std::move(name), true, std::move(children));
}

namespace {
/**
 * First member whose key matches ignoring case, in document order.
 */
const nlohmann::ordered_json* findKey(const nlohmann::ordered_json& object, std::string_view key) {
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (Util::equalsIgnoreCase(it.key(), key)) {
            return &it.value();
        }
    }
    return nullptr;
}
} // namespace

TaxonomyNode TaxonomyNode::fromValue(const nlohmann::ordered_json& value) {
    if (value.is_string()) {
        return playlist(value.get<std::string>());
    }

    if (value.is_object()) {
        const auto* name = findKey(value, "name");
        const auto* playlists = findKey(value, "playlists");
        if (name != nullptr && name->is_string() && playlists != nullptr && playlists->is_array()) {
            std::vector<TaxonomyNode> children;
            children.reserve(playlists->size());
            for (const auto& child : *playlists) {
                children.push_back(fromValue(child));
            }
            return folder(name->get<std::string>(), std::move(children));
        }
    }

    throw InvalidTaxonomyError(
        fmt::format("Encountered invalid input type {}: {}", value.type_name(), value.dump()));
}

std::string TaxonomyNode::toString() const {
    if (!folder_) {
        return name_;
    }
    std::vector<std::string> names;
    for (const auto& child : children_) {
        names.push_back(child.toString());
    }
    return fmt::format("{}: [{}]", name_, fmt::join(names, ", "));
}

TaxonomyNode CombinerSection::taxonomy() const {
    std::vector<TaxonomyNode> leaves;
    leaves.reserve(expressions.size());
    for (const auto& expression : expressions) {
        leaves.push_back(TaxonomyNode::playlist(expression));
    }
    return TaxonomyNode::folder(name, std::move(leaves));
}

PlaylistConfig& PlaylistConfig::addSection(TagParserKind parser, TaxonomyNode taxonomy) {
    sections_.push_back(TaxonomySection{parser, std::move(taxonomy)});
    return *this;
}

PlaylistConfig& PlaylistConfig::setCombiner(CombinerSection combiner) {
    combiner_ = std::move(combiner);
    return *this;
}

namespace {
CombinerSection parseCombiner(const nlohmann::ordered_json& value) {
    if (!value.is_object()) {
        throw InvalidTaxonomyError(
            fmt::format("Combiner must be an object, found {}: {}", value.type_name(), value.dump()));
    }

    CombinerSection combiner;
    if (const auto* name = findKey(value, "name")) {
        if (!name->is_string()) {
            throw InvalidTaxonomyError(fmt::format("Combiner name must be a string: {}", name->dump()));
        }
        combiner.name = name->get<std::string>();
    }
    if (const auto* playlists = findKey(value, "playlists")) {
        if (!playlists->is_array()) {
            throw InvalidTaxonomyError(
                fmt::format("Combiner playlists must be an array: {}", playlists->dump()));
        }
        for (const auto& expression : *playlists) {
            if (!expression.is_string()) {
                throw InvalidTaxonomyError(
                    fmt::format("Combiner expressions must be strings: {}", expression.dump()));
            }
            combiner.expressions.push_back(expression.get<std::string>());
        }
    }
    return combiner;
}
} // namespace

PlaylistConfig PlaylistConfig::fromValue(const nlohmann::ordered_json& value) {
    PlaylistConfig config;
    if (value.is_null()) {
        return config;
    }
    if (!value.is_object()) {
        throw InvalidTaxonomyError(
            fmt::format("Playlist configuration must be an object, found {}", value.type_name()));
    }

    for (auto it = value.begin(); it != value.end(); ++it) {
        const std::string& key = it.key();
        const auto& section = it.value();
        if (key == COMBINER_KEY) {
            if (config.combiner_) {
                throw InvalidTaxonomyError("Combiner is configured more than once");
            }
            config.combiner_ = parseCombiner(section);
            continue;
        }

        auto kind = TagParser::kindFromName(key);
        if (!kind) {
            throw InvalidTaxonomyError(fmt::format("{} is not a valid TagParser!", key));
        }
        const bool repeated = std::any_of(config.sections_.begin(), config.sections_.end(),
                                          [&kind](const TaxonomySection& existing) {
                                              return existing.parser == *kind;
                                          });
        if (repeated) {
            throw InvalidTaxonomyError(fmt::format("{} is configured more than once", key));
        }

        TaxonomyNode taxonomy = TaxonomyNode::fromValue(section);
        if (!taxonomy.isFolder() || taxonomy.isIgnoreMarker()) {
            throw InvalidTaxonomyError(
                fmt::format("{} must be configured with a named folder: {}", key, section.dump()));
        }
        config.sections_.push_back(TaxonomySection{*kind, std::move(taxonomy)});
    }
    return config;
}

} // namespace autocrate
