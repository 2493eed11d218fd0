#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "connectfour/core/game_config.h"
#include "connectfour/core/errors.h"

namespace connectfour {
namespace core {

TEST(GameConfigTest, Defaults) {
    GameConfig config;

    EXPECT_EQ(config.rows, 6);
    EXPECT_EQ(config.columns, 7);
    EXPECT_EQ(config.seed, 0u);
    EXPECT_EQ(config.maxInvalidAttempts, 3);
    EXPECT_EQ(config.logLevel, "info");
    EXPECT_EQ(config.getBoardSize(), (BoardSize{6, 7}));
    EXPECT_NO_THROW(config.validate());
}

TEST(GameConfigTest, MissingKeysKeepDefaults) {
    GameConfig config = GameConfig::fromJson("{\"rows\": 5, \"seed\": 42}");

    EXPECT_EQ(config.rows, 5);
    EXPECT_EQ(config.columns, 7);
    EXPECT_EQ(config.seed, 42u);
    EXPECT_EQ(config.maxInvalidAttempts, 3);

    GameConfig empty = GameConfig::fromJson("{}");
    EXPECT_EQ(empty.getBoardSize(), (BoardSize{6, 7}));
}

TEST(GameConfigTest, JsonKeepsEveryField) {
    GameConfig config;
    config.rows = 8;
    config.columns = 9;
    config.seed = 1234;
    config.maxInvalidAttempts = 1;
    config.logLevel = "debug";

    GameConfig restored = GameConfig::fromJson(config.toJson());
    EXPECT_EQ(restored.rows, 8);
    EXPECT_EQ(restored.columns, 9);
    EXPECT_EQ(restored.seed, 1234u);
    EXPECT_EQ(restored.maxInvalidAttempts, 1);
    EXPECT_EQ(restored.logLevel, "debug");
}

TEST(GameConfigTest, MalformedJsonRejected) {
    EXPECT_THROW(GameConfig::fromJson("{rows: 5"), GameConstructionError);
    EXPECT_THROW(GameConfig::fromJson("[6, 7]"), GameConstructionError);
    EXPECT_THROW(GameConfig::fromJson("{\"rows\": \"six\"}"), GameConstructionError);
}

TEST(GameConfigTest, SeedMustFitUnsigned32Bits) {
    EXPECT_THROW(GameConfig::fromJson("{\"seed\": -1}"), GameConstructionError);
    EXPECT_THROW(GameConfig::fromJson("{\"seed\": 4294967296}"), GameConstructionError);

    EXPECT_EQ(GameConfig::fromJson("{\"seed\": 0}").seed, 0u);
    EXPECT_EQ(GameConfig::fromJson("{\"seed\": 4294967295}").seed, 4294967295u);
}

TEST(GameConfigTest, ValidateRejectsBadValues) {
    GameConfig config;

    config.rows = 0;
    EXPECT_THROW(config.validate(), GameConstructionError);

    config = GameConfig{};
    config.columns = -7;
    EXPECT_THROW(config.validate(), GameConstructionError);

    config = GameConfig{};
    config.maxInvalidAttempts = 0;
    EXPECT_THROW(config.validate(), GameConstructionError);

    config = GameConfig{};
    config.logLevel = "verbose";
    EXPECT_THROW(config.validate(), GameConstructionError);

    config.logLevel = "off";
    EXPECT_NO_THROW(config.validate());

    // fromJson validates as well
    EXPECT_THROW(GameConfig::fromJson("{\"columns\": 0}"), GameConstructionError);
}

TEST(GameConfigTest, LoadFromFile) {
    std::string path = ::testing::TempDir() + "connectfour_config_test.json";
    {
        std::ofstream file(path);
        file << "{\"rows\": 4, \"columns\": 5, \"log_level\": \"warn\"}";
    }

    GameConfig config = GameConfig::loadFromFile(path);
    EXPECT_EQ(config.getBoardSize(), (BoardSize{4, 5}));
    EXPECT_EQ(config.logLevel, "warn");

    std::remove(path.c_str());

    EXPECT_THROW(GameConfig::loadFromFile(path), GameConstructionError);
}

} // namespace core
} // namespace connectfour
