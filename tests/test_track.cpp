#include <gtest/gtest.h>

#include "Errors.hpp"
#include "Track.hpp"

using namespace Jukebox;
using json = nlohmann::json;

TEST(TrackTest, BareFileName) {
    Track track("some-filename.mp3");
    EXPECT_EQ(track.file(), "some-filename.mp3");
    EXPECT_FALSE(track.startAt().has_value());
    EXPECT_FALSE(track.endAt().has_value());
}

TEST(TrackTest, StringConfigIsAFileName) {
    Track track(json("intro.mp3"));
    EXPECT_EQ(track, Track("intro.mp3"));
}

TEST(TrackTest, StructuredConfigConvertsTrimPoints) {
    Track track(json{{"file", "intro.mp3"}, {"start_at", "00:01:05"}, {"end_at", "01:00:00"}});
    EXPECT_EQ(track.file(), "intro.mp3");
    ASSERT_TRUE(track.startAt().has_value());
    ASSERT_TRUE(track.endAt().has_value());
    EXPECT_EQ(*track.startAt(), 65000);
    EXPECT_EQ(*track.endAt(), 3600000);
}

TEST(TrackTest, StructuredConfigWithoutTrimPoints) {
    Track track(json{{"file", "intro.mp3"}});
    EXPECT_FALSE(track.startAt().has_value());
    EXPECT_FALSE(track.endAt().has_value());
}

TEST(TrackTest, ParseTimeIsExact) {
    EXPECT_EQ(Track::parseTime("00:01:05"), 65000);
    EXPECT_EQ(Track::parseTime("0:0:0"), 0);
    EXPECT_EQ(Track::parseTime("1:2:3"), 3723000);
}

TEST(TrackTest, ParseTimeDoesNotBoundFields) {
    EXPECT_EQ(Track::parseTime("25:61:99"), (25 * 3600 + 61 * 60 + 99) * 1000LL);
}

TEST(TrackTest, MalformedTimesAreRejected) {
    for (const char* text : {"1:2", "", "::", "1::2", "1:2:", ":1:2", "1:2:3:4", "a:b:c", "-1:00:00",
                             "00:01:05.5", " 00:01:05"}) {
        EXPECT_THROW(Track::parseTime(text), FormatError) << "'" << text << "'";
    }
}

TEST(TrackTest, FormatErrorIsAConfigError) {
    const json config = {{"file", "a.mp3"}, {"end_at", "1:2"}};
    EXPECT_THROW(Track{config}, ConfigError);
}

TEST(TrackTest, MissingFileIsAConfigError) {
    const json noFile = {{"start_at", "00:00:01"}};
    const json numericFile = {{"file", 12}};
    const json number = 42;
    EXPECT_THROW(Track{noFile}, ConfigError);
    EXPECT_THROW(Track{numericFile}, ConfigError);
    EXPECT_THROW(Track{number}, ConfigError);
}

TEST(TrackTest, EqualityComparesAllFields) {
    EXPECT_EQ(Track("a.mp3"), Track("a.mp3"));
    EXPECT_EQ(Track("a.mp3", 1000, 2000), Track("a.mp3", 1000, 2000));
    EXPECT_NE(Track("a.mp3"), Track("b.mp3"));
    EXPECT_NE(Track("a.mp3", 1000, std::nullopt), Track("a.mp3"));
    EXPECT_NE(Track("a.mp3", std::nullopt, 2000), Track("a.mp3", std::nullopt, 3000));
}
