#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "autocrate/Collection.hpp"
#include "autocrate/Types.hpp"
#include "autocrate/Util.hpp"

namespace autocrate::combiner {

enum class NumericClass {
    Rating,  // 0 through MAX_RATING
    Bpm      // above MAX_RATING
};

/**
 * One valid comma part of a "[...]" selector, as an inclusive range. A
 * single number has low == high.
 */
struct NumericSelector {
    std::string literal;  // the whole bracket text the part came from
    NumericClass numericClass;
    int64_t low;
    int64_t high;

    bool contains(int64_t value) const { return value >= low && value <= high; }

    bool operator==(const NumericSelector& other) const {
        return literal == other.literal && numericClass == other.numericClass &&
               low == other.low && high == other.high;
    }
};

/**
 * Looks through every Combiner expression once, before evaluation, for
 * "{Playlist}" and "[bpm/rating]" selectors.
 *
 * Numeric selectors are turned into track sets by visiting the collection
 * once and registering matching tracks under the selector's literal text,
 * so evaluation can treat them like plain tags.
 */
class SelectorPrescanner {
public:
    static constexpr const char* COMPONENT = "SelectorPrescanner";

    explicit SelectorPrescanner(const std::vector<std::string>& expressions);

    /**
     * Names inside every "{...}" selector, braces stripped.
     */
    const std::set<std::string>& getPlaylistNames() const { return playlistNames_; }

    const std::vector<NumericSelector>& getNumericSelectors() const { return numericSelectors_; }

    /**
     * Literals of the selectors a value matches.
     */
    std::set<std::string> lookup(NumericClass numericClass, int64_t value) const;

    /**
     * Register every real track of the collection under the literal of each
     * numeric selector its rounded BPM or decoded rating matches.
     */
    void scan(const Collection& collection, TagTrackIds& tracks);

    const std::vector<LogEntry>& getDiagnostics() const { return diagnostics_; }

private:
    void parseBracket(const std::string& payload);

    std::set<std::string> playlistNames_;
    std::set<std::string> literals_;
    std::vector<NumericSelector> numericSelectors_;
    std::vector<LogEntry> diagnostics_;
};

} // namespace autocrate::combiner
