#pragma once

#include <cstdint>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace autocrate {

// ============================================================================
// JSONL Structured Logging
// ============================================================================

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * JSONL formatted log entry for machine-readable diagnostics.
 */
struct LogEntry {
    LogLevel level;
    std::string message;
    std::string source;
    int64_t timestamp_ms;

    [[nodiscard]] std::string toJsonl() const;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * String, rating and logging helpers shared by the tag parsers, the
 * taxonomy builder and the Combiner.
 */
class Util {
public:
    /**
     * The six rating bytes a collection document may carry, indexed by the
     * number of stars they encode.
     */
    static constexpr int ENCODED_RATINGS[] = {0, 51, 102, 153, 204, 255};

    /**
     * Highest star rating. Bracket selector numbers up to this value are
     * ratings, anything above is a BPM.
     */
    static constexpr int MAX_RATING = 5;

    /**
     * Decode a rating byte into 0-5 stars.
     *
     * @param encoded one of ENCODED_RATINGS
     * @return the star count, or std::nullopt for a non-canonical byte
     */
    [[nodiscard]] static constexpr std::optional<int> decodeRating(int encoded) noexcept {
        for (int stars = 0; stars <= MAX_RATING; ++stars) {
            if (ENCODED_RATINGS[stars] == encoded) {
                return stars;
            }
        }
        return std::nullopt;
    }

    /**
     * Round to the nearest integer, ties to even. Values outside the int64_t
     * range saturate; NaN rounds to 0.
     */
    [[nodiscard]] static int64_t roundHalfEven(double value) noexcept;

    /**
     * Strip leading and trailing whitespace.
     */
    [[nodiscard]] static std::string trim(std::string_view text);

    /**
     * Split on every occurrence of a non-empty delimiter. Always returns at
     * least one element; segments are not trimmed.
     */
    [[nodiscard]] static std::vector<std::string> split(std::string_view text, std::string_view delimiter);

    /**
     * True if the text is non-empty and made only of ASCII digits.
     */
    [[nodiscard]] static bool isDigits(std::string_view text) noexcept;

    /**
     * NFC-normalize and case-fold UTF-8 text (utf8proc). Invalid UTF-8 falls
     * back to ASCII lower-casing.
     */
    [[nodiscard]] static std::string foldCase(std::string_view text);

    [[nodiscard]] static bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

    [[nodiscard]] static bool equalsIgnoreCase(std::string_view a, std::string_view b);

    /**
     * Escape a string for embedding inside a JSON string literal.
     */
    [[nodiscard]] static std::string escapeJson(std::string_view text);

    [[nodiscard]] static int64_t currentTimeMillis();

    /**
     * Create a JSONL log entry with source location.
     */
    [[nodiscard]] static LogEntry createLogEntry(
        LogLevel level,
        const std::string& message,
        int64_t timestamp_ms,
        const std::source_location& loc = std::source_location::current()
    );

    /**
     * Report a diagnostic: print "component: message" to stderr and record
     * it in the sink so callers can inspect it later.
     */
    static void report(std::vector<LogEntry>& sink, LogLevel level,
                       std::string_view component, const std::string& message);

private:
    Util() = delete; // Prevent instantiation
};

} // namespace autocrate
