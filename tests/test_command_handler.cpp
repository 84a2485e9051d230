#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "CommandHandler.hpp"
#include "TestSupport.hpp"

using namespace Jukebox;
using namespace Jukebox::test;
using json = nlohmann::json;

class CommandHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_shared<FakeMediaEngine>();
        engine->setDefaultDuration(60000);
        json config = {{"volume", 50},
                       {"directory", dir.path()},
                       {"groups", json::array({json{
                           {"name", "Tavern"},
                           {"track_lists", json::array({
                               json{{"name", "Evening"}, {"tracks", json::array({"a.mp3"})}},
                               json{{"name", "Brawl"}, {"tracks", json::array({"a.mp3", "a.mp3"})}}})}}})}};
        manager = std::make_unique<MusicManager>(config, engine, fastTiming(), 3);
        handler = std::make_unique<CommandHandler>(*manager);
    }

    TempMusicDir dir{{"a.mp3"}};
    std::shared_ptr<FakeMediaEngine> engine;
    std::unique_ptr<MusicManager> manager;
    std::unique_ptr<CommandHandler> handler;
};

TEST_F(CommandHandlerTest, ListShowsIndices) {
    EXPECT_EQ(handler->handle("list"),
              "OK\n0 Tavern\n  0 0 Brawl (2 tracks)\n  0 1 Evening (1 tracks)\n");
}

TEST_F(CommandHandlerTest, PlayStatusStop) {
    EXPECT_EQ(handler->handle("play 0 1\n"), "OK: Playing Evening\n");
    EXPECT_EQ(handler->handle("status"), "OK: PLAYING Tavern / Evening volume=50\n");
    EXPECT_EQ(handler->handle("stop"), "OK\n");
    EXPECT_EQ(handler->handle("status"), "OK: IDLE (last session cancelled) volume=50\n");
}

TEST_F(CommandHandlerTest, PlayRejectsBadArguments) {
    EXPECT_EQ(handler->handle("play"), "ERROR: Usage: play <group> <list>\n");
    EXPECT_EQ(handler->handle("play 0"), "ERROR: Usage: play <group> <list>\n");
    EXPECT_EQ(handler->handle("play x 1"), "ERROR: Usage: play <group> <list>\n");
    EXPECT_EQ(handler->handle("play 0 1 2"), "ERROR: Usage: play <group> <list>\n");
    EXPECT_EQ(handler->handle("play 3 0").rfind("ERROR: Group index 3 out of range", 0), 0u);
    EXPECT_FALSE(manager->isPlaying());
}

TEST_F(CommandHandlerTest, VolumeCommand) {
    EXPECT_EQ(handler->handle("volume 20 instant"), "OK: Volume 20\n");
    EXPECT_EQ(manager->volume(), 20);
    EXPECT_EQ(handler->handle("volume 101"), "ERROR: Usage: volume <0-100> [instant]\n");
    EXPECT_EQ(handler->handle("volume 20 slowly"), "ERROR: Usage: volume <0-100> [instant]\n");
    EXPECT_EQ(manager->volume(), 20);
}

TEST_F(CommandHandlerTest, UnknownCommand) {
    EXPECT_EQ(handler->handle("rewind"), "ERROR: Unknown command 'rewind'\n");
    EXPECT_EQ(handler->handle("   "), "ERROR: Empty command\n");
}

TEST_F(CommandHandlerTest, SmoothVolumeCommandUsesAShortFade) {
    ASSERT_EQ(handler->handle("play 0 1"), "OK: Playing Evening\n");
    ASSERT_TRUE(waitUntil([this]() {
        auto records = engine->records();
        return records.size() == 1 && !records[0].volumes.empty() && records[0].volumes.back() == 50;
    }));

    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(handler->handle("volume 20"), "OK: Volume 20\n");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(400));
    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
    EXPECT_EQ(engine->records()[0].volumes.back(), 20);
    EXPECT_EQ(manager->volume(), 20);
}

TEST_F(CommandHandlerTest, ZeroFadeMakesVolumeInstant) {
    CommandHandler instant(*manager, 0.0);
    ASSERT_EQ(instant.handle("play 0 1"), "OK: Playing Evening\n");
    ASSERT_TRUE(waitUntil([this]() {
        auto records = engine->records();
        return records.size() == 1 && !records[0].volumes.empty() && records[0].volumes.back() == 50;
    }));
    const size_t before = engine->records()[0].volumes.size();

    EXPECT_EQ(instant.handle("volume 30"), "OK: Volume 30\n");
    auto volumes = engine->records()[0].volumes;
    EXPECT_EQ(std::vector<int>(volumes.begin() + before, volumes.end()), std::vector<int>{30});
}
