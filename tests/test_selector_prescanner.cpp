/**
 * @file test_selector_prescanner.cpp
 * @brief Unit tests for playlist and BPM/rating selector prescanning
 */

#include <catch2/catch_all.hpp>
#include <autocrate/Collection.hpp>
#include <autocrate/combiner/SelectorPrescanner.hpp>
#include <set>
#include <string>
#include <vector>

using namespace autocrate;
using namespace autocrate::combiner;

namespace {
Track makeTrack(const std::string& id, double bpm, int rating, const std::string& location = "file://localhost/x.mp3") {
    return Track::Builder().setId(id).setBpm(bpm).setRating(rating).setLocation(location).build();
}
} // namespace

TEST_CASE("SelectorPrescanner playlist names", "[SelectorPrescanner]") {
    SelectorPrescanner prescanner({"Techno & {My Favorites}", "{Warm Up} | {My Favorites} | House"});
    CHECK(prescanner.getPlaylistNames() == std::set<std::string>{"My Favorites", "Warm Up"});
    CHECK(prescanner.getNumericSelectors().empty());
    CHECK(prescanner.getDiagnostics().empty());
}

TEST_CASE("SelectorPrescanner numeric literals", "[SelectorPrescanner]") {
    SECTION("Numbers up to 5 are ratings, above are BPMs") {
        SelectorPrescanner prescanner({"[5] | [6]"});
        const auto& selectors = prescanner.getNumericSelectors();
        REQUIRE(selectors.size() == 2);
        CHECK(selectors[0] == NumericSelector{"[5]", NumericClass::Rating, 5, 5});
        CHECK(selectors[1] == NumericSelector{"[6]", NumericClass::Bpm, 6, 6});
    }

    SECTION("Several parts share one literal") {
        SelectorPrescanner prescanner({"Techno & [120-129, 140, 4-5]"});
        const auto& selectors = prescanner.getNumericSelectors();
        REQUIRE(selectors.size() == 3);
        CHECK(selectors[0] == NumericSelector{"[120-129, 140, 4-5]", NumericClass::Bpm, 120, 129});
        CHECK(selectors[1] == NumericSelector{"[120-129, 140, 4-5]", NumericClass::Bpm, 140, 140});
        CHECK(selectors[2] == NumericSelector{"[120-129, 140, 4-5]", NumericClass::Rating, 4, 5});
    }

    SECTION("Reversed range is normalized") {
        SelectorPrescanner prescanner({"[130-120]"});
        REQUIRE(prescanner.getNumericSelectors().size() == 1);
        CHECK(prescanner.getNumericSelectors()[0].low == 120);
        CHECK(prescanner.getNumericSelectors()[0].high == 130);
    }

    SECTION("Repeated literal is scanned once") {
        SelectorPrescanner prescanner({"[4]", "House & [4]"});
        CHECK(prescanner.getNumericSelectors().size() == 1);
    }

    SECTION("Range across rating and BPM is rejected") {
        SelectorPrescanner prescanner({"[5-7]"});
        CHECK(prescanner.getNumericSelectors().empty());
        REQUIRE(prescanner.getDiagnostics().size() == 1);
        CHECK(prescanner.getDiagnostics()[0].level == LogLevel::Error);
        CHECK(prescanner.getDiagnostics()[0].message == "Bad BPM or rating number range: 5-7");
    }

    SECTION("Malformed part is rejected, valid parts are kept") {
        SelectorPrescanner prescanner({"[fast, 128, 1-2-3]"});
        REQUIRE(prescanner.getNumericSelectors().size() == 1);
        CHECK(prescanner.getNumericSelectors()[0].low == 128);
        REQUIRE(prescanner.getDiagnostics().size() == 2);
        CHECK(prescanner.getDiagnostics()[0].message == "Malformed BPM or rating filter part: fast");
        CHECK(prescanner.getDiagnostics()[1].message == "Malformed BPM or rating filter part: 1-2-3");
        CHECK(prescanner.getDiagnostics()[1].source == SelectorPrescanner::COMPONENT);
    }

    SECTION("lookup") {
        SelectorPrescanner prescanner({"[120-129] | [125] | [4-5]"});
        CHECK(prescanner.lookup(NumericClass::Bpm, 125) == std::set<std::string>{"[120-129]", "[125]"});
        CHECK(prescanner.lookup(NumericClass::Bpm, 130).empty());
        CHECK(prescanner.lookup(NumericClass::Rating, 4) == std::set<std::string>{"[4-5]"});
        CHECK(prescanner.lookup(NumericClass::Rating, 125).empty());
    }
}

TEST_CASE("SelectorPrescanner::scan", "[SelectorPrescanner]") {
    Collection collection({
        makeTrack("1", 126.5, 255),
        makeTrack("2", 127.5, 204),
        makeTrack("3", 140.2, 100),
        makeTrack("4", 126.0, 255, ""),
    });

    SECTION("BPMs round half to even") {
        SelectorPrescanner prescanner({"[126] | [128]"});
        TagTrackIds tracks;
        prescanner.scan(collection, tracks);
        CHECK(tracks["[126]"] == TrackIdSet{"1"});
        CHECK(tracks["[128]"] == TrackIdSet{"2"});
    }

    SECTION("Ratings") {
        SelectorPrescanner prescanner({"[5]", "[3-4]"});
        TagTrackIds tracks;
        prescanner.scan(collection, tracks);
        CHECK(tracks["[5]"] == TrackIdSet{"1"});
        CHECK(tracks["[3-4]"] == TrackIdSet{"2"});
    }

    SECTION("Non-canonical ratings are reported") {
        SelectorPrescanner prescanner({"[140]"});
        TagTrackIds tracks;
        prescanner.scan(collection, tracks);
        CHECK(tracks["[140]"] == TrackIdSet{"3"});
        REQUIRE(prescanner.getDiagnostics().size() == 1);
        CHECK(prescanner.getDiagnostics()[0].level == LogLevel::Warning);
        CHECK(prescanner.getDiagnostics()[0].message == "Track 3 has a non-canonical rating 100, ignoring it");
    }

    SECTION("Nothing to scan") {
        SelectorPrescanner prescanner({"Techno | {My Favorites}"});
        TagTrackIds tracks;
        prescanner.scan(collection, tracks);
        CHECK(tracks.empty());
        CHECK(prescanner.getDiagnostics().empty());
    }
}
