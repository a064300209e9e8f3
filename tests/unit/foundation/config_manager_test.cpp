#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "crs/foundation/config_manager.hpp"

using namespace crs::foundation;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Unique directory per test so ctest --parallel does not collide.
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("crs_config_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("crs.yaml", R"(
rating:
  elo_k_factor: 24
logging:
  level: "debug"
)");

    ConfigManager config;
    auto loadResult = config.load(path);
    ASSERT_TRUE(loadResult.hasValue());

    auto k = config.get<int>("rating.elo_k_factor");
    ASSERT_TRUE(k.hasValue());
    EXPECT_EQ(k.value(), 24);

    auto level = config.get<std::string>("logging.level");
    ASSERT_TRUE(level.hasValue());
    EXPECT_EQ(level.value(), "debug");
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    auto path = writeYaml("empty.yaml", "{}");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("rating.elo_k_factor");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    auto path = writeYaml("types.yaml", "rating:\n  elo_k_factor: fast\n");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("rating.elo_k_factor");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load(tmpDir_ / "missing.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, LoadMalformedYaml) {
    auto path = writeYaml("broken.yaml", "rating: [1, 2\n");
    ConfigManager config;
    auto result = config.load(path);
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, GetOrFallsBackOnlyWhenAbsent) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("summary:\n  top_players: ten\n").hasValue());

    auto absent = config.getOr<int>("rating.elo_k_factor", 32);
    ASSERT_TRUE(absent.hasValue());
    EXPECT_EQ(absent.value(), 32);

    auto mismatched = config.getOr<int>("summary.top_players", 5);
    EXPECT_TRUE(mismatched.hasError());
    EXPECT_EQ(mismatched.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, SectionIsNotAValue) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("logging:\n  level:\n    name: debug\n").hasValue());

    auto level = config.get<std::string>("logging.level");
    ASSERT_TRUE(level.hasError());
    EXPECT_EQ(level.error().code(), ErrorCode::ConfigTypeMismatch);

    auto fallback = config.getOr<std::string>("logging.level", "info");
    ASSERT_TRUE(fallback.hasError());
    EXPECT_EQ(fallback.error().code(), ErrorCode::ConfigTypeMismatch);

    // A sibling key sharing a prefix is not a section.
    EXPECT_EQ(config.get<std::string>("logging.lev").error().code(),
              ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, LoadReplacesPreviousEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("rating:\n  elo_k_factor: 24\n").hasValue());
    ASSERT_TRUE(config.loadFromString("summary:\n  top_players: 3\n").hasValue());

    EXPECT_FALSE(config.hasKey("rating.elo_k_factor"));
    EXPECT_TRUE(config.hasKey("summary.top_players"));
}

TEST_F(ConfigManagerTest, HasKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("rating:\n  initial_elo: 1500\n").hasValue());

    EXPECT_TRUE(config.hasKey("rating.initial_elo"));
    EXPECT_FALSE(config.hasKey("rating"));
    EXPECT_FALSE(config.hasKey("missing"));
}
