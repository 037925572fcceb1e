#include <gtest/gtest.h>
#include "core/Config.h"
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

using namespace TermCanvas::Core;
using TermCanvas::Terminal::BorderStyle;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for test configs
        testDir = std::filesystem::temp_directory_path() / "termcanvas_config_test";
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        // Clean up temp files
        std::filesystem::remove_all(testDir);
    }

    std::filesystem::path testDir;

    std::string WriteTestConfig(const std::string& filename, const std::string& content) {
        std::ofstream file(testDir / filename);
        file << content;
        return (testDir / filename).string();
    }
};

// Defaults
TEST_F(ConfigTest, DefaultValues) {
    Config config;
    EXPECT_EQ(config.GetScreen().width, 80);
    EXPECT_EQ(config.GetScreen().height, 24);
    EXPECT_EQ(config.GetScreen().textWidth, 10);
    EXPECT_EQ(config.GetScreen().textHeight, 20);
    EXPECT_EQ(config.GetScreen().borderStyle, "single");
    EXPECT_EQ(config.GetSixel().paletteSize, 1024);
    EXPECT_FALSE(config.GetSixel().fastMode);
    EXPECT_EQ(config.GetSixel().alphaThreshold, 102);
    EXPECT_TRUE(config.GetSixel().dither);
    EXPECT_EQ(config.GetLogging().level, "info");
    EXPECT_FALSE(config.IsLoaded());
}

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    Config config;
    EXPECT_TRUE(config.Load((testDir / "missing.json").string()));
    EXPECT_TRUE(config.IsLoaded());
    EXPECT_TRUE(config.GetWarnings().empty());
    EXPECT_EQ(config.GetSixel().paletteSize, 1024);
}

// Section parsing
TEST_F(ConfigTest, ParseScreenSection) {
    auto path = WriteTestConfig("screen.json", R"({
        "screen": {
            "width": 132,
            "height": 43,
            "textWidth": 8,
            "textHeight": 16,
            "borderStyle": "Double"
        }
    })");

    Config config;
    ASSERT_TRUE(config.Load(path));
    EXPECT_EQ(config.GetScreen().width, 132);
    EXPECT_EQ(config.GetScreen().height, 43);
    EXPECT_EQ(config.GetScreen().textWidth, 8);
    EXPECT_EQ(config.GetScreen().textHeight, 16);
    EXPECT_EQ(config.GetScreen().borderStyle, "double");
    EXPECT_EQ(config.GetBorderStyle(), BorderStyle::Double);
    EXPECT_TRUE(config.GetWarnings().empty());
}

TEST_F(ConfigTest, ParseSixelSection) {
    auto path = WriteTestConfig("sixel.json", R"({
        "sixel": {
            "paletteSize": 256,
            "fastMode": true,
            "alphaThreshold": 10,
            "samplesPerColor": 0,
            "colorCacheSize": 32,
            "dither": false,
            "allowTransparency": false
        }
    })");

    Config config;
    ASSERT_TRUE(config.Load(path));
    auto options = config.GetSixelOptions();
    EXPECT_EQ(options.paletteSize, 256);
    EXPECT_TRUE(options.fastMode);
    EXPECT_EQ(options.alphaThreshold, 10);
    EXPECT_EQ(options.samplesPerColor, 0);
    EXPECT_EQ(options.colorCacheSize, 32);
    EXPECT_FALSE(options.dither);
    EXPECT_FALSE(options.allowTransparency);
    EXPECT_EQ(options.EffectivePaletteSize(), 64);
}

TEST_F(ConfigTest, ParseLoggingSection) {
    auto path = WriteTestConfig("logging.json", R"({ "logging": { "level": "DEBUG" } })");

    Config config;
    ASSERT_TRUE(config.Load(path));
    EXPECT_EQ(config.GetLogging().level, "debug");
}

TEST_F(ConfigTest, PartialConfigKeepsOtherDefaults) {
    auto path = WriteTestConfig("partial.json", R"({ "screen": { "width": 100 } })");

    Config config;
    ASSERT_TRUE(config.Load(path));
    EXPECT_EQ(config.GetScreen().width, 100);
    EXPECT_EQ(config.GetScreen().height, 24);
    EXPECT_EQ(config.GetSixel().paletteSize, 1024);
}

// Invalid input
TEST_F(ConfigTest, InvalidJsonFails) {
    auto path = WriteTestConfig("broken.json", R"({ "screen": { "width": )");

    Config config;
    EXPECT_FALSE(config.Load(path));
    EXPECT_FALSE(config.IsLoaded());
    ASSERT_FALSE(config.GetWarnings().empty());
    EXPECT_EQ(config.GetWarnings()[0].rfind("Invalid JSON", 0), 0u);
    EXPECT_EQ(config.GetScreen().width, 80);
}

TEST_F(ConfigTest, TopLevelMustBeObject) {
    auto path = WriteTestConfig("array.json", "[1, 2, 3]");

    Config config;
    EXPECT_FALSE(config.Load(path));
    EXPECT_FALSE(config.GetWarnings().empty());
}

TEST_F(ConfigTest, PaletteSizeNotPowerOfTwo) {
    auto path = WriteTestConfig("palette.json", R"({ "sixel": { "paletteSize": 100 } })");

    Config config;
    ASSERT_TRUE(config.Load(path));
    EXPECT_EQ(config.GetSixel().paletteSize, 1024);
    EXPECT_EQ(config.GetWarnings().size(), 1u);
}

TEST_F(ConfigTest, PaletteSizeOutOfRange) {
    auto path = WriteTestConfig("palette.json", R"({ "sixel": { "paletteSize": 4096 } })");

    Config config;
    ASSERT_TRUE(config.Load(path));
    EXPECT_EQ(config.GetSixel().paletteSize, 1024);
    EXPECT_FALSE(config.GetWarnings().empty());
}

TEST_F(ConfigTest, WrongTypesWarnAndKeepDefaults) {
    auto path = WriteTestConfig("types.json", R"({
        "screen": { "width": "wide", "height": 0 },
        "sixel": { "fastMode": "yes", "alphaThreshold": 300 }
    })");

    Config config;
    ASSERT_TRUE(config.Load(path));
    EXPECT_EQ(config.GetScreen().width, 80);
    EXPECT_EQ(config.GetScreen().height, 24);
    EXPECT_FALSE(config.GetSixel().fastMode);
    EXPECT_EQ(config.GetSixel().alphaThreshold, 102);
    EXPECT_EQ(config.GetWarnings().size(), 4u);
}

TEST_F(ConfigTest, UnknownBorderStyleAndLevel) {
    auto path = WriteTestConfig("unknown.json", R"({
        "screen": { "borderStyle": "wavy" },
        "logging": { "level": "loud" }
    })");

    Config config;
    ASSERT_TRUE(config.Load(path));
    EXPECT_EQ(config.GetScreen().borderStyle, "single");
    EXPECT_EQ(config.GetBorderStyle(), BorderStyle::Single);
    EXPECT_EQ(config.GetLogging().level, "info");
    EXPECT_EQ(config.GetWarnings().size(), 2u);
}

TEST_F(ConfigTest, ReloadResetsPreviousValues) {
    auto first = WriteTestConfig("first.json", R"({ "screen": { "width": 120 } })");
    auto second = WriteTestConfig("second.json", R"({ "screen": { "height": 50 } })");

    Config config;
    ASSERT_TRUE(config.Load(first));
    ASSERT_TRUE(config.Load(second));
    EXPECT_EQ(config.GetScreen().width, 80);
    EXPECT_EQ(config.GetScreen().height, 50);
}

// Applying the screen section
TEST_F(ConfigTest, CreateScreenFromConfig) {
    auto path = WriteTestConfig("apply.json", R"({
        "screen": { "width": 100, "height": 30, "textWidth": 9, "textHeight": 18,
                    "borderStyle": "round" }
    })");

    Config config;
    ASSERT_TRUE(config.Load(path));
    auto screen = config.CreateScreen();
    ASSERT_NE(screen, nullptr);
    EXPECT_EQ(screen->GetWidth(), 100);
    EXPECT_EQ(screen->GetHeight(), 30);
    EXPECT_EQ(screen->GetTextWidth(), 9);
    EXPECT_EQ(screen->GetTextHeight(), 18);
    EXPECT_EQ(screen->GetBorderStyle(), BorderStyle::Round);

    TermCanvas::Terminal::CellAttributes attr;
    screen->DrawFrame(0, 0, 3, 3, attr, attr);
    EXPECT_EQ(screen->GetCharXY(0, 0).ch, BorderStyle::Round.topLeft);
}

TEST_F(ConfigTest, ApplyToKeepsContentWhenSizeMatches) {
    Config config;
    config.GetScreenMut().textWidth = 12;
    config.GetScreenMut().borderStyle = "double";

    TermCanvas::Terminal::LogicalScreen screen(80, 24);
    screen.PutCharXY(1, 1, U'k');
    config.ApplyTo(screen);

    EXPECT_EQ(screen.GetCharXY(1, 1).ch, U'k');
    EXPECT_EQ(screen.GetTextWidth(), 12);
    EXPECT_EQ(screen.GetBorderStyle(), BorderStyle::Double);

    config.GetScreenMut().width = 40;
    config.ApplyTo(screen);
    EXPECT_EQ(screen.GetWidth(), 40);
    EXPECT_TRUE(screen.GetCharXY(1, 1).IsBlank());
}

// Save
TEST_F(ConfigTest, SaveAndReload) {
    Config config;
    config.GetScreenMut().width = 100;
    config.GetScreenMut().borderStyle = "round";
    config.GetSixelMut().paletteSize = 128;
    config.GetSixelMut().dither = false;
    config.GetLoggingMut().level = "warn";

    auto path = (testDir / "nested" / "saved.json").string();
    ASSERT_TRUE(config.Save(path));

    Config loaded;
    ASSERT_TRUE(loaded.Load(path));
    EXPECT_TRUE(loaded.GetWarnings().empty());
    EXPECT_EQ(loaded.GetScreen().width, 100);
    EXPECT_EQ(loaded.GetBorderStyle(), BorderStyle::Round);
    EXPECT_EQ(loaded.GetSixel().paletteSize, 128);
    EXPECT_FALSE(loaded.GetSixel().dither);
    EXPECT_EQ(loaded.GetLogging().level, "warn");
}

// Log levels
TEST_F(ConfigTest, ParseLogLevelNames) {
    EXPECT_TRUE(Config::ParseLogLevel("trace") == spdlog::level::trace);
    EXPECT_TRUE(Config::ParseLogLevel("Info") == spdlog::level::info);
    EXPECT_TRUE(Config::ParseLogLevel("warning") == spdlog::level::warn);
    EXPECT_TRUE(Config::ParseLogLevel("error") == spdlog::level::err);
    EXPECT_TRUE(Config::ParseLogLevel("off") == spdlog::level::off);
    EXPECT_FALSE(Config::ParseLogLevel("verbose").has_value());
    EXPECT_FALSE(Config::ParseLogLevel("").has_value());
}

TEST_F(ConfigTest, ApplyLogLevel) {
    auto previous = spdlog::get_level();

    Config config;
    config.GetLoggingMut().level = "error";
    config.ApplyLogLevel();
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);

    spdlog::set_level(previous);
}
