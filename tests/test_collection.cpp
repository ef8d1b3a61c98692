/**
 * @file test_collection.cpp
 * @brief Unit tests for Track, Collection and PlaylistTree
 */

#include <catch2/catch_all.hpp>
#include <autocrate/Collection.hpp>
#include <autocrate/PlaylistTree.hpp>
#include <autocrate/Track.hpp>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace autocrate;

namespace {
Track makeTrack(const std::string& id, const std::string& location = "file://localhost/a.mp3") {
    return Track::Builder().setId(id).setGenre("Techno").setBpm(128.0).setRating(255).setLocation(location).build();
}
} // namespace

// =============================================================================
// Track Tests
// =============================================================================

TEST_CASE("Track::Builder", "[Track]") {
    SECTION("Attributes") {
        Track track = Track::Builder()
            .setId("42")
            .setGenre("Techno / House")
            .setComments("/* Dark */")
            .setBpm(126.5)
            .setRating(204)
            .setLocation("file://localhost/t.mp3")
            .build();

        CHECK(track.getId() == "42");
        CHECK(track.getGenre() == "Techno / House");
        CHECK(track.getComments() == "/* Dark */");
        CHECK(track.getBpm() == Catch::Approx(126.5));
        CHECK(track.getRoundedBpm() == 126);
        CHECK(track.getEncodedRating() == 204);
        CHECK(track.getRating() == 4);
        CHECK(track.hasLocation());
    }

    SECTION("Empty id rejected") {
        CHECK_THROWS_AS(Track::Builder().setBpm(120.0).build(), std::invalid_argument);
    }

    SECTION("Invalid BPM rejected") {
        CHECK_THROWS_AS(Track::Builder().setId("1").setBpm(-1.0).build(), std::invalid_argument);
        CHECK_THROWS_AS(Track::Builder().setId("1").setBpm(std::numeric_limits<double>::quiet_NaN()).build(),
                        std::invalid_argument);
        CHECK_THROWS_AS(Track::Builder().setId("1").setBpm(1e30).build(), std::invalid_argument);
        CHECK_THROWS_AS(Track::Builder().setId("1").setBpm(Track::MAX_BPM + 0.5).build(), std::invalid_argument);
        CHECK(Track::Builder().setId("1").setBpm(Track::MAX_BPM).build().getRoundedBpm() == 1000);
    }

    SECTION("Non-canonical rating decodes to nothing") {
        Track track = Track::Builder().setId("1").setRating(100).build();
        CHECK_FALSE(track.getRating().has_value());
        CHECK(track.getEncodedRating() == 100);
    }

    SECTION("Missing location") {
        Track track = Track::Builder().setId("1").build();
        CHECK_FALSE(track.hasLocation());
    }

    SECTION("Equality and string form") {
        CHECK(makeTrack("1") == makeTrack("1"));
        CHECK(makeTrack("1") != makeTrack("2"));
        CHECK(makeTrack("7").toString() == "Track[id:7, genre:Techno, bpm:128.00, rating:255]");
    }
}

// =============================================================================
// Collection Tests
// =============================================================================

TEST_CASE("Collection tracks", "[Collection]") {
    Collection collection({makeTrack("1"), makeTrack("2", ""), makeTrack("3")});

    SECTION("Duplicate ids rejected") {
        CHECK_THROWS_AS(collection.addTrack(makeTrack("1")), std::invalid_argument);
    }

    SECTION("Only tracks with a location are real tracks") {
        std::vector<TrackId> visited;
        collection.forEachTrack([&visited](const Track& track) {
            visited.push_back(track.getId());
            return true;
        });
        CHECK(visited == std::vector<TrackId>{"1", "3"});
        CHECK(collection.getTrackCount() == 2);
        CHECK(collection.getAllTracks().size() == 3);
    }

    SECTION("Iteration stops when the callback returns false") {
        int calls = 0;
        collection.forEachTrack([&calls](const Track&) {
            ++calls;
            return false;
        });
        CHECK(calls == 1);
    }

    SECTION("findTrack") {
        auto found = collection.findTrack("3");
        REQUIRE(found.has_value());
        CHECK(found->getId() == "3");
        CHECK_FALSE(collection.findTrack("99").has_value());
    }

    SECTION("Existing playlists") {
        auto& playlists = collection.getPlaylists();
        const auto favorites = playlists.addPlaylist(PlaylistTree::ROOT, "My Favorites");
        playlists.appendTrack(favorites, "1");
        const Collection& view = collection;
        CHECK(view.getPlaylists().findByName("My Favorites") == favorites);
    }
}

// =============================================================================
// PlaylistTree Tests
// =============================================================================

TEST_CASE("PlaylistTree structure", "[PlaylistTree]") {
    PlaylistTree tree("AUTO_PLAYLISTS");
    const auto genres = tree.addFolder(PlaylistTree::ROOT, "Genres");
    const auto techno = tree.addPlaylist(genres, "Techno");
    const auto bass = tree.addFolder(genres, "Bass");
    const auto dnb = tree.addPlaylist(bass, "DnB");
    const auto house = tree.addPlaylist(genres, "House");

    SECTION("Nodes") {
        CHECK(tree.size() == 6);
        CHECK(tree.getNode(PlaylistTree::ROOT).name == "AUTO_PLAYLISTS");
        CHECK(tree.getNode(PlaylistTree::ROOT).isFolder());
        CHECK_FALSE(tree.getNode(PlaylistTree::ROOT).parent.has_value());
        CHECK(tree.getNode(techno).parent == genres);
        CHECK(tree.getNode(genres).children == std::vector<NodeIndex>{techno, bass, house});
    }

    SECTION("Invalid operations") {
        CHECK_THROWS_AS(tree.addPlaylist(techno, "Nested"), std::invalid_argument);
        CHECK_THROWS_AS(tree.addFolder(techno, "Nested"), std::invalid_argument);
        CHECK_THROWS_AS(tree.appendTrack(genres, "1"), std::invalid_argument);
        CHECK_THROWS_AS(tree.getNode(99), std::out_of_range);
        CHECK_THROWS_AS(tree.moveToFront(PlaylistTree::ROOT), std::invalid_argument);
    }

    SECTION("Lookups") {
        CHECK(tree.findByName("DnB") == dnb);
        CHECK(tree.findByName("Genres") == genres);
        CHECK_FALSE(tree.findByName("Dubstep").has_value());
        CHECK(tree.findByName("House", bass) == std::nullopt);
        CHECK(tree.childNamed(genres, "Bass") == bass);
        CHECK_FALSE(tree.childNamed(genres, "DnB").has_value());
        CHECK(tree.path(dnb) == "AUTO_PLAYLISTS / Genres / Bass / DnB");
    }

    SECTION("Leaves in declared order") {
        CHECK(tree.leaves() == std::vector<NodeIndex>{techno, dnb, house});
        CHECK(tree.leaves(bass) == std::vector<NodeIndex>{dnb});
    }

    SECTION("Tracks keep insertion order") {
        tree.appendTrack(techno, "2");
        tree.appendTrack(techno, "1");
        CHECK(tree.trackIds(techno) == std::vector<TrackId>{"2", "1"});
    }

    SECTION("moveToFront") {
        tree.moveToFront(house);
        CHECK(tree.getNode(genres).children == std::vector<NodeIndex>{house, techno, bass});
    }
}

TEST_CASE("PlaylistTree rendering", "[PlaylistTree]") {
    PlaylistTree tree;
    const auto folder = tree.addFolder(PlaylistTree::ROOT, "My \"Tags\"");
    const auto dark = tree.addPlaylist(folder, "Dark");
    tree.appendTrack(dark, "1");
    tree.appendTrack(dark, "3");
    tree.addPlaylist(folder, "Chill");

    SECTION("JSON") {
        CHECK(tree.toJson(dark) == R"({"name":"Dark","type":"playlist","tracks":["1","3"]})");
        CHECK(tree.toJson() ==
              R"({"name":"ROOT","type":"folder","playlists":[{"name":"My \"Tags\"","type":"folder","playlists":[)"
              R"({"name":"Dark","type":"playlist","tracks":["1","3"]},{"name":"Chill","type":"playlist","tracks":[]}]}]})");
        const auto value = tree.toJsonValue(folder);
        CHECK(value["playlists"].size() == 2);
        CHECK(value["playlists"][0]["tracks"] == nlohmann::ordered_json::array({"1", "3"}));
        CHECK(tree.toJson(dark) == value["playlists"][0].dump());
    }

    SECTION("Listing") {
        CHECK(tree.toString() ==
              "+ ROOT\n"
              "  + My \"Tags\"\n"
              "    - Dark (2 tracks)\n"
              "    - Chill (0 tracks)\n");
    }
}
