#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/tasks/TaskParameters.hpp"
#include "TestUtils.hpp"

namespace umedia::core {

using umedia::test::TempDir;

namespace {

class config : public ::testing::Test {
protected:
    void SetUp() override { Config::instance().setDefaults(); }
    void TearDown() override { Config::instance().setDefaults(); }
};

} // namespace

TEST_F(config, defaults) {
    auto& cfg = Config::instance();
    EXPECT_EQ(cfg.get<std::string>("downloads.defaultVideoQuality"), "best");
    EXPECT_EQ(cfg.get<std::string>("downloads.defaultAudioFormat"), "mp3");
    EXPECT_EQ(cfg.get<std::string>("downloads.defaultAudioQuality"), "192");
    EXPECT_EQ(cfg.get<int>("downloads.pollIntervalSeconds"), 2);
    EXPECT_EQ(cfg.get<int>("downloads.waitTimeoutSeconds"), 300);
    EXPECT_EQ(cfg.get<int>("retrieval.chunkSize"), 65536);
    EXPECT_EQ(cfg.get<std::string>("missing.key", "fallback"), "fallback");
}

TEST_F(config, set_has_remove) {
    auto& cfg = Config::instance();
    EXPECT_TRUE(cfg.set<int>("downloads.pollIntervalSeconds", 5));
    EXPECT_EQ(cfg.get<int>("downloads.pollIntervalSeconds"), 5);

    EXPECT_TRUE(cfg.set<std::string>("custom.nested.value", "x"));
    EXPECT_TRUE(cfg.has("custom.nested.value"));
    cfg.remove("custom.nested.value");
    EXPECT_FALSE(cfg.has("custom.nested.value"));

    // Wrong type yields the default
    EXPECT_EQ(cfg.get<int>("downloads.defaultAudioFormat", 7), 7);
}

TEST_F(config, load_merges_over_defaults) {
    TempDir dir;
    auto path = dir / "config.json";
    {
        std::ofstream out(path);
        out << R"({"downloads": {"defaultAudioFormat": "opus", "pollIntervalSeconds": 4}})";
    }

    auto& cfg = Config::instance();
    ASSERT_TRUE(cfg.load(path.string()));
    EXPECT_EQ(cfg.path(), path.string());
    EXPECT_EQ(cfg.get<std::string>("downloads.defaultAudioFormat"), "opus");
    EXPECT_EQ(cfg.get<std::string>("downloads.defaultVideoQuality"), "best");

    auto defaults = tasks::TaskDefaults::fromConfig(cfg);
    EXPECT_EQ(defaults.audioFormat, "opus");
    EXPECT_EQ(defaults.audioQuality, "192");
    EXPECT_EQ(defaults.pollIntervalSeconds, 4);
}

TEST_F(config, load_rejects_bad_files) {
    TempDir dir;
    auto path = dir / "broken.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }

    auto& cfg = Config::instance();
    EXPECT_FALSE(cfg.load(path.string()));
    EXPECT_FALSE(cfg.load((dir / "missing.json").string()));
    EXPECT_EQ(cfg.get<std::string>("downloads.defaultAudioFormat"), "mp3");
}

TEST_F(config, save_creates_parent_directories) {
    TempDir dir;
    auto path = dir / "nested" / "config.json";

    auto& cfg = Config::instance();
    cfg.set<std::string>("downloads.defaultVideoQuality", "720p");
    ASSERT_TRUE(cfg.save(path.string()));
    ASSERT_TRUE(std::filesystem::exists(path));

    cfg.setDefaults();
    ASSERT_TRUE(cfg.load(path.string()));
    EXPECT_EQ(cfg.get<std::string>("downloads.defaultVideoQuality"), "720p");
}

TEST_F(config, environment_overrides) {
    ::setenv("UMEDIA_DEFAULT_AUDIO_FORMAT", "flac", 1);
    ::setenv("UMEDIA_LOG_LEVEL", "debug", 1);
    ::setenv("UMEDIA_DEFAULT_VIDEO_QUALITY", "", 1);

    auto& cfg = Config::instance();
    cfg.applyEnvironment();

    EXPECT_EQ(cfg.get<std::string>("downloads.defaultAudioFormat"), "flac");
    EXPECT_EQ(cfg.get<std::string>("logging.level"), "debug");
    EXPECT_EQ(cfg.get<std::string>("downloads.defaultVideoQuality"), "best");

    ::unsetenv("UMEDIA_DEFAULT_AUDIO_FORMAT");
    ::unsetenv("UMEDIA_LOG_LEVEL");
    ::unsetenv("UMEDIA_DEFAULT_VIDEO_QUALITY");
}

TEST(log_level, parse) {
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_EQ(parseLogLevel("verbose"), LogLevel::Info);
}

TEST(logger, info_messages_reach_the_file_without_explicit_flush) {
    TempDir dir;
    Logger::instance().initialize(LogLevel::Info, dir.path().string());
    Logger::instance().info("periodic flush marker {}", 42);

    auto logFile = dir / "umedia.log";
    bool found = umedia::test::eventually([&logFile] {
        std::ifstream in(logFile);
        std::stringstream content;
        content << in.rdbuf();
        return content.str().find("periodic flush marker 42") != std::string::npos;
    }, std::chrono::seconds(6));
    EXPECT_TRUE(found);

    Logger::instance().setLevel(LogLevel::Off);
}

} // namespace umedia::core
