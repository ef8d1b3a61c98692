/**
 * Autocrate demo - builds tag playlists for a small sample collection
 *
 * Usage:
 *   autocrate_demo              # Playlist tree as JSON, diagnostics as JSONL on stderr
 *   autocrate_demo --human      # Indented listing instead of JSON
 *   autocrate_demo --stats      # Also print Combiner tag statistics
 *   autocrate_demo --help       # Show help
 */

#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <autocrate/Autocrate.hpp>

namespace {

void printHelp() {
    std::cout << R"(
Autocrate demo v)" << autocrate::Version::STRING << R"(

Usage:
  autocrate_demo [OPTIONS]

Options:
  --json          Output the playlist tree as JSON (default)
  --human         Output an indented, human-readable listing
  --stats         Print tag statistics for the Combiner playlists
  --help, -h      Show this help message

)" << std::endl;
}

autocrate::Track makeTrack(const std::string& id, const std::string& genre, const std::string& comments,
                           double bpm, int rating) {
    return autocrate::Track::Builder()
        .setId(id)
        .setGenre(genre)
        .setComments(comments)
        .setBpm(bpm)
        .setRating(rating)
        .setLocation("file://localhost/music/" + id + ".mp3")
        .build();
}

autocrate::Collection sampleCollection() {
    autocrate::Collection collection;
    collection.addTrack(makeTrack("1", "Techno / Minimal Deep Tech", "/* Dark / Peak Time */", 128.0, 255));
    collection.addTrack(makeTrack("2", "House / Deep House", "/* Chill */", 122.4, 204));
    collection.addTrack(makeTrack("3", "Techno / House", "/* Dark / Chill */", 126.5, 153));
    collection.addTrack(makeTrack("4", "Hip Hop / R&B", "", 92.0, 255));
    collection.addTrack(makeTrack("5", "Hip Hop / Trap", "/* Dark */", 140.0, 102));
    collection.addTrack(makeTrack("6", "Drum & Bass / Liquid", "/* Vocal */", 174.0, 204));

    auto& playlists = collection.getPlaylists();
    const auto favorites = playlists.addPlaylist(autocrate::PlaylistTree::ROOT, "My Favorites");
    playlists.appendTrack(favorites, "1");
    return collection;
}

nlohmann::ordered_json sampleConfig() {
    return nlohmann::ordered_json::parse(R"({
        "GenreTagParser": {
            "name": "Genres",
            "playlists": [
                "Hip Hop",
                {"name": "Techno", "playlists": ["Techno", "Minimal Deep Tech"]},
                {"name": "House", "playlists": ["House", "Deep House"]},
                {"name": "Bass", "playlists": ["Hip Hop", "Trap", "Drum & Bass"]}
            ]
        },
        "MyTagParser": {
            "name": "My Tags",
            "playlists": [
                "Dark",
                "Chill",
                {"name": "_ignore", "playlists": ["Vocal"]}
            ]
        },
        "Combiner": {
            "name": "Combiner",
            "playlists": [
                "(Techno | House) ~ {My Favorites}",
                "Dark & [4-5]",
                "*House & [120-125]"
            ]
        }
    })");
}

} // namespace

int main(int argc, char* argv[]) {
    bool humanReadable = false;
    bool showStats = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--json") == 0) {
            humanReadable = false;
        } else if (std::strcmp(argv[i], "--human") == 0) {
            humanReadable = true;
        } else if (std::strcmp(argv[i], "--stats") == 0) {
            showStats = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printHelp();
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            printHelp();
            return 1;
        }
    }

    try {
        autocrate::BuilderSettings settings;
        settings.setPureGenrePlaylists({"Techno"})
            .setRemainderType(autocrate::BuilderSettings::REMAINDER_FOLDER)
            .addLeafFilter(autocrate::LeafFilter::minimalDeepTech());

        const autocrate::PlaylistBuilder builder(autocrate::PlaylistConfig::fromValue(sampleConfig()), settings);
        const auto collection = sampleCollection();
        const auto result = builder.build(collection);

        if (humanReadable) {
            std::cout << result.tree.toString();
        } else {
            std::cout << result.tree.toJson() << std::endl;
        }

        if (showStats) {
            std::cout << autocrate::TagStatistics::render(autocrate::PlaylistBuilder::combinerStatistics(result))
                      << std::endl;
        }

        for (const auto& entry : result.diagnostics) {
            std::cerr << entry.toJsonl() << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
