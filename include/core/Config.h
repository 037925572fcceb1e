#pragma once

#include "graphics/SixelOptions.h"
#include "terminal/BorderStyle.h"
#include "terminal/LogicalScreen.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/common.h>

namespace TermCanvas::Core {

// Screen geometry and drawing defaults
struct ScreenConfig {
    int width = 80;
    int height = 24;
    int textWidth = 10;        // Pixel size of one text cell
    int textHeight = 20;
    std::string borderStyle = "single";
};

// Sixel encoder tunables, see Graphics::SixelOptions
struct SixelConfig {
    int paletteSize = 1024;
    bool fastMode = false;
    int alphaThreshold = 102;
    int samplesPerColor = 64;
    int colorCacheSize = 256;
    bool dither = true;
    bool allowTransparency = true;
};

struct LogConfig {
    std::string level = "info";
};

// Main configuration class
class Config {
public:
    Config();
    ~Config() = default;

    // Load configuration from a JSON file; a missing file keeps the defaults
    bool Load(const std::string& path);

    // Save configuration to file
    bool Save(const std::string& path) const;

    // Accessors
    const ScreenConfig& GetScreen() const { return m_screen; }
    const SixelConfig& GetSixel() const { return m_sixel; }
    const LogConfig& GetLogging() const { return m_logging; }

    // Mutable accessors for testing
    ScreenConfig& GetScreenMut() { return m_screen; }
    SixelConfig& GetSixelMut() { return m_sixel; }
    LogConfig& GetLoggingMut() { return m_logging; }

    // Options the encoder is constructed and reloaded with
    Graphics::SixelOptions GetSixelOptions() const;

    const Terminal::BorderStyle& GetBorderStyle() const;

    // Size, text cell size and border style from the screen section.
    // The grid is only reallocated when the size differs.
    void ApplyTo(Terminal::LogicalScreen& screen) const;
    std::shared_ptr<Terminal::LogicalScreen> CreateScreen() const;

    // Set the global spdlog level from logging.level
    void ApplyLogLevel() const;

    static std::optional<spdlog::level::level_enum> ParseLogLevel(const std::string& name);

    // Check if config was loaded successfully
    bool IsLoaded() const { return m_loaded; }

    // Get any warnings from loading
    const std::vector<std::string>& GetWarnings() const { return m_warnings; }

private:
    bool ParseJson(const std::string& json);
    void SetDefaults();

    ScreenConfig m_screen;
    SixelConfig m_sixel;
    LogConfig m_logging;

    bool m_loaded = false;
    std::vector<std::string> m_warnings;
};

} // namespace TermCanvas::Core
