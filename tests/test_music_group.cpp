#include <gtest/gtest.h>

#include "Errors.hpp"
#include "MusicGroup.hpp"

using namespace Jukebox;
using json = nlohmann::json;

namespace {

json trackList(const std::string& name) {
    return {{"name", name}, {"tracks", json::array({"x.mp3"})}};
}

} // namespace

TEST(MusicGroupTest, TrackListsAreSortedByDefault) {
    MusicGroup group(json{{"name", "Ambience"},
                          {"track_lists", {trackList("Tavern"), trackList("Forest"), trackList("Cave")}}});
    ASSERT_EQ(group.trackLists().size(), 3u);
    EXPECT_EQ(group.trackLists()[0].name(), "Cave");
    EXPECT_EQ(group.trackLists()[1].name(), "Forest");
    EXPECT_EQ(group.trackLists()[2].name(), "Tavern");
}

TEST(MusicGroupTest, SortCanBeDisabled) {
    MusicGroup group(json{{"name", "Ambience"},
                          {"sort", false},
                          {"track_lists", {trackList("Tavern"), trackList("Forest"), trackList("Cave")}}});
    EXPECT_EQ(group.trackLists()[0].name(), "Tavern");
    EXPECT_EQ(group.trackLists()[1].name(), "Forest");
    EXPECT_EQ(group.trackLists()[2].name(), "Cave");
}

TEST(MusicGroupTest, DirectoryIsOptional) {
    MusicGroup plain(json{{"name", "G"}, {"track_lists", json::array()}});
    EXPECT_FALSE(plain.directory().has_value());

    MusicGroup withDir(json{{"name", "G"}, {"directory", "/music/g"}, {"track_lists", json::array()}});
    EXPECT_EQ(withDir.directory(), std::optional<std::string>("/music/g"));
}

TEST(MusicGroupTest, RequiredFields) {
    const json noName = {{"track_lists", json::array()}};
    const json noTrackLists = {{"name", "G"}};
    const json brokenTrackList = {{"name", "G"}, {"track_lists", json::array({json{{"name", "T"}}})}};
    EXPECT_THROW(MusicGroup{noName}, ConfigError);
    EXPECT_THROW(MusicGroup{noTrackLists}, ConfigError);
    EXPECT_THROW(MusicGroup{brokenTrackList}, ConfigError);
}

TEST(MusicGroupTest, EqualityRecursesIntoTrackLists) {
    json config = {{"name", "G"}, {"track_lists", {trackList("A"), trackList("B")}}};
    MusicGroup a(config);
    EXPECT_EQ(a, MusicGroup(config));

    config["track_lists"][1]["loop"] = false;
    EXPECT_NE(a, MusicGroup(config));
}
