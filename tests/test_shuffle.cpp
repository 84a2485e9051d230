#include <gtest/gtest.h>

#include <algorithm>
#include <random>

#include "Shuffle.hpp"
#include "Track.hpp"

using namespace Jukebox;

TEST(ShuffleTest, InputIsNotModified) {
    const std::vector<Track> tracks = {Track("a.mp3"), Track("b.mp3"), Track("c.mp3"), Track("d.mp3")};
    const std::vector<Track> before = tracks;
    std::mt19937 rng(7);

    for (int i = 0; i < 10; i++) {
        std::vector<Track> order = shuffled(tracks, rng);
        EXPECT_TRUE(std::is_permutation(order.begin(), order.end(), tracks.begin(), tracks.end()));
    }
    EXPECT_EQ(tracks, before);
}

TEST(ShuffleTest, SameSeedSameOrder) {
    std::vector<int> items(20);
    for (int i = 0; i < 20; i++) items[i] = i;

    std::mt19937 a(1234);
    std::mt19937 b(1234);
    EXPECT_EQ(shuffled(items, a), shuffled(items, b));
}

TEST(ShuffleTest, ShortSequences) {
    std::mt19937 rng(1);
    EXPECT_TRUE(shuffled(std::vector<int>{}, rng).empty());
    EXPECT_EQ(shuffled(std::vector<int>{5}, rng), std::vector<int>{5});
}
