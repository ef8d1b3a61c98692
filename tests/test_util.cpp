/**
 * @file test_util.cpp
 * @brief Unit tests for Util functions and JSONL log entries
 */

#include <catch2/catch_all.hpp>
#include <autocrate/Util.hpp>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace autocrate;

TEST_CASE("Util::decodeRating", "[Util]") {
    SECTION("Canonical bytes") {
        CHECK(Util::decodeRating(0) == 0);
        CHECK(Util::decodeRating(51) == 1);
        CHECK(Util::decodeRating(102) == 2);
        CHECK(Util::decodeRating(153) == 3);
        CHECK(Util::decodeRating(204) == 4);
        CHECK(Util::decodeRating(255) == 5);
    }

    SECTION("Non-canonical bytes") {
        CHECK_FALSE(Util::decodeRating(1).has_value());
        CHECK_FALSE(Util::decodeRating(100).has_value());
        CHECK_FALSE(Util::decodeRating(-51).has_value());
    }

    SECTION("Usable at compile time") {
        static_assert(Util::decodeRating(204) == 4);
    }
}

TEST_CASE("Util::roundHalfEven", "[Util]") {
    CHECK(Util::roundHalfEven(0.5) == 0);
    CHECK(Util::roundHalfEven(1.5) == 2);
    CHECK(Util::roundHalfEven(2.5) == 2);
    CHECK(Util::roundHalfEven(126.5) == 126);
    CHECK(Util::roundHalfEven(127.5) == 128);
    CHECK(Util::roundHalfEven(127.49) == 127);
    CHECK(Util::roundHalfEven(127.51) == 128);

    SECTION("Out of range values saturate") {
        CHECK(Util::roundHalfEven(1e30) == std::numeric_limits<int64_t>::max());
        CHECK(Util::roundHalfEven(-1e30) == std::numeric_limits<int64_t>::min());
        CHECK(Util::roundHalfEven(std::numeric_limits<double>::infinity()) == std::numeric_limits<int64_t>::max());
        CHECK(Util::roundHalfEven(std::numeric_limits<double>::quiet_NaN()) == 0);
        CHECK(Util::roundHalfEven(-9223372036854775808.0) == std::numeric_limits<int64_t>::min());
    }
}

TEST_CASE("Util::trim", "[Util]") {
    CHECK(Util::trim("  Techno ") == "Techno");
    CHECK(Util::trim("\tDeep House\n") == "Deep House");
    CHECK(Util::trim("   ").empty());
    CHECK(Util::trim("").empty());
}

TEST_CASE("Util::split", "[Util]") {
    SECTION("Single delimiter") {
        CHECK(Util::split("Techno / House", "/") == std::vector<std::string>{"Techno ", " House"});
    }

    SECTION("No delimiter present") {
        CHECK(Util::split("Techno", "/") == std::vector<std::string>{"Techno"});
    }

    SECTION("Empty text gives one empty segment") {
        CHECK(Util::split("", "/") == std::vector<std::string>{""});
    }

    SECTION("Adjacent delimiters keep empty segments") {
        CHECK(Util::split("a//b/", "/") == std::vector<std::string>{"a", "", "b", ""});
    }

    SECTION("Multi-character delimiter") {
        CHECK(Util::split("a, b,c", ", ") == std::vector<std::string>{"a", "b,c"});
    }
}

TEST_CASE("Util::isDigits", "[Util]") {
    CHECK(Util::isDigits("0"));
    CHECK(Util::isDigits("128"));
    CHECK_FALSE(Util::isDigits(""));
    CHECK_FALSE(Util::isDigits("-5"));
    CHECK_FALSE(Util::isDigits("12.5"));
    CHECK_FALSE(Util::isDigits("5 "));
}

TEST_CASE("Util case-insensitive matching", "[Util]") {
    SECTION("ASCII folding") {
        CHECK(Util::foldCase("HIP Hop") == "hip hop");
        CHECK(Util::containsIgnoreCase("Alternative R&B", "r&b"));
        CHECK_FALSE(Util::containsIgnoreCase("Trap", "hip hop"));
    }

    SECTION("Unicode folding") {
        CHECK(Util::foldCase("STRASSE") == Util::foldCase("Straße"));
        CHECK(Util::equalsIgnoreCase("ÉLECTRO", "électro"));
    }

    SECTION("Composed and decomposed forms compare equal") {
        CHECK(Util::equalsIgnoreCase("Caf\xC3\xA9", "Cafe\xCC\x81"));
    }
}

TEST_CASE("Util::escapeJson", "[Util]") {
    CHECK(Util::escapeJson("plain") == "plain");
    CHECK(Util::escapeJson("say \"hi\"") == "say \\\"hi\\\"");
    CHECK(Util::escapeJson("a\\b") == "a\\\\b");
    CHECK(Util::escapeJson("line\nbreak") == "line\\nbreak");
    CHECK(Util::escapeJson(std::string("\x01", 1)) == "\\u0001");
}

TEST_CASE("LogEntry JSONL output", "[Util]") {
    SECTION("Serialized fields") {
        LogEntry entry{LogLevel::Warning, "Playlist \"Dub\" received no tracks", "TaxonomyTreeBuilder", 1234};
        CHECK(entry.toJsonl() ==
              R"({"level":"warning","message":"Playlist \"Dub\" received no tracks",)"
              R"("source":"TaxonomyTreeBuilder","timestamp_ms":1234})");
    }

    SECTION("createLogEntry records the call site") {
        auto entry = Util::createLogEntry(LogLevel::Error, "boom", 42);
        CHECK(entry.level == LogLevel::Error);
        CHECK(entry.timestamp_ms == 42);
        CHECK(entry.source.find("test_util.cpp") != std::string::npos);
    }

    SECTION("report records into the sink") {
        std::vector<LogEntry> sink;
        Util::report(sink, LogLevel::Info, "Component", "hello");
        REQUIRE(sink.size() == 1);
        CHECK(sink[0].message == "hello");
        CHECK(sink[0].source == "Component");
        CHECK(sink[0].timestamp_ms > 0);
    }
}
