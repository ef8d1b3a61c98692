#include "autocrate/combiner/SelectorPrescanner.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <regex>

#include <fmt/format.h>

namespace autocrate::combiner {

namespace {
const std::regex& bracketPattern() {
    static const std::regex pattern(R"(\[([^\[\]]*)\])");
    return pattern;
}

const std::regex& playlistPattern() {
    static const std::regex pattern(R"(\{([^{}]*)\})");
    return pattern;
}

std::optional<int64_t> parseNumber(std::string_view text) {
    if (!Util::isDigits(text)) {
        return std::nullopt;
    }
    int64_t value = 0;
    const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (error != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

NumericClass classify(int64_t value) {
    return value <= Util::MAX_RATING ? NumericClass::Rating : NumericClass::Bpm;
}
} // namespace

SelectorPrescanner::SelectorPrescanner(const std::vector<std::string>& expressions) {
    for (const auto& expression : expressions) {
        for (std::sregex_iterator it(expression.begin(), expression.end(), playlistPattern()), end; it != end; ++it) {
            playlistNames_.insert((*it)[1].str());
        }
        for (std::sregex_iterator it(expression.begin(), expression.end(), bracketPattern()), end; it != end; ++it) {
            parseBracket((*it)[1].str());
        }
    }
}

void SelectorPrescanner::parseBracket(const std::string& payload) {
    const std::string literal = "[" + payload + "]";
    if (!literals_.insert(literal).second) {
        return;
    }

    for (const auto& rawPart : Util::split(payload, ",")) {
        const std::string part = Util::trim(rawPart);

        if (auto number = parseNumber(part)) {
            numericSelectors_.push_back(NumericSelector{literal, classify(*number), *number, *number});
            continue;
        }

        const auto bounds = Util::split(part, "-");
        if (bounds.size() == 2) {
            auto first = parseNumber(bounds[0]);
            auto second = parseNumber(bounds[1]);
            if (first && second) {
                const int64_t low = std::min(*first, *second);
                const int64_t high = std::max(*first, *second);
                if (classify(low) != classify(high)) {
                    Util::report(diagnostics_, LogLevel::Error, COMPONENT,
                                 fmt::format("Bad BPM or rating number range: {}", part));
                    continue;
                }
                numericSelectors_.push_back(NumericSelector{literal, classify(low), low, high});
                continue;
            }
        }

        Util::report(diagnostics_, LogLevel::Error, COMPONENT,
                     fmt::format("Malformed BPM or rating filter part: {}", part));
    }
}

std::set<std::string> SelectorPrescanner::lookup(NumericClass numericClass, int64_t value) const {
    std::set<std::string> literals;
    for (const auto& selector : numericSelectors_) {
        if (selector.numericClass == numericClass && selector.contains(value)) {
            literals.insert(selector.literal);
        }
    }
    return literals;
}

void SelectorPrescanner::scan(const Collection& collection, TagTrackIds& tracks) {
    if (numericSelectors_.empty()) {
        return;
    }

    collection.forEachTrack([this, &tracks](const Track& track) {
        for (const auto& literal : lookup(NumericClass::Bpm, track.getRoundedBpm())) {
            tracks[literal].insert(track.getId());
        }

        const auto rating = track.getRating();
        if (!rating) {
            Util::report(diagnostics_, LogLevel::Warning, COMPONENT,
                         fmt::format("Track {} has a non-canonical rating {}, ignoring it",
                                     track.getId(), track.getEncodedRating()));
            return true;
        }
        for (const auto& literal : lookup(NumericClass::Rating, *rating)) {
            tracks[literal].insert(track.getId());
        }
        return true;
    });
}

} // namespace autocrate::combiner
