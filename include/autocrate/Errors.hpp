#pragma once

#include <stdexcept>

namespace autocrate {

/**
 * A boolean expression whose operators and operands do not line up, or whose
 * parentheses are unbalanced. Fatal to that expression only.
 */
class MalformedExpressionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * A "{Playlist Name}" selector naming a playlist that does not exist.
 * Aborts the Combiner run.
 */
class UnknownSelectorError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

/**
 * A playlist configuration entry that is neither a tag string nor a
 * {name, playlists} folder record.
 */
class InvalidTaxonomyError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace autocrate
