#include "core/Config.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace TermCanvas::Core {

using nlohmann::json;

namespace {

constexpr int kMaxScreenSize = 1000;
constexpr int kMaxTextCellSize = 256;
constexpr int kMaxColorCacheSize = 65536;

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool IsKnownBorderStyle(const std::string& name) {
    static const char* const kNames[] = {
        "none", "default", "single", "double", "round", "singlevdoubleh", "singlehdoublev"
    };
    std::string lower = ToLower(name);
    return std::any_of(std::begin(kNames), std::end(kNames),
                       [&lower](const char* n) { return lower == n; });
}

} // namespace

Config::Config() {
    SetDefaults();
}

void Config::SetDefaults() {
    m_screen = ScreenConfig();
    m_sixel = SixelConfig();
    m_logging = LogConfig();
}

bool Config::Load(const std::string& path) {
    SetDefaults();
    m_warnings.clear();
    m_loaded = false;

    if (!std::filesystem::exists(path)) {
        spdlog::info("Config file {} not found, using defaults", path);
        m_loaded = true;
        return true;
    }

    std::ifstream file(path);
    if (!file) {
        m_warnings.push_back("Could not open config file: " + path);
        spdlog::error("Could not open config file {}", path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!ParseJson(buffer.str())) {
        SetDefaults();
        return false;
    }

    for (const auto& warning : m_warnings) {
        spdlog::warn("Config: {}", warning);
    }
    spdlog::info("Loaded config from {}", path);
    m_loaded = true;
    return true;
}

bool Config::ParseJson(const std::string& content) {
    json root;
    try {
        root = json::parse(content);
    } catch (const std::exception& e) {
        m_warnings.push_back(std::string("Invalid JSON: ") + e.what());
        spdlog::error("Config parse error: {}", e.what());
        return false;
    }

    if (!root.is_object()) {
        m_warnings.push_back("Expected a JSON object at top level");
        return false;
    }

    // Integer in [minValue, maxValue]; anything else warns and keeps the default
    auto readInt = [this](const json& section, const char* sectionName, const char* key,
                          int minValue, int maxValue, int& target) {
        if (!section.contains(key)) {
            return;
        }
        const json& value = section[key];
        std::string name = std::string(sectionName) + "." + key;
        if (!value.is_number_integer()) {
            m_warnings.push_back(name + " must be an integer");
            return;
        }
        int64_t v = value.get<int64_t>();
        if (v < minValue || v > maxValue) {
            m_warnings.push_back(name + " out of range (" + std::to_string(minValue) + "-" +
                                 std::to_string(maxValue) + "), using default");
            return;
        }
        target = static_cast<int>(v);
    };

    auto readBool = [this](const json& section, const char* sectionName, const char* key,
                           bool& target) {
        if (!section.contains(key)) {
            return;
        }
        const json& value = section[key];
        if (!value.is_boolean()) {
            m_warnings.push_back(std::string(sectionName) + "." + key + " must be true or false");
            return;
        }
        target = value.get<bool>();
    };

    if (root.contains("screen") && root["screen"].is_object()) {
        const json& screen = root["screen"];
        readInt(screen, "screen", "width", 1, kMaxScreenSize, m_screen.width);
        readInt(screen, "screen", "height", 1, kMaxScreenSize, m_screen.height);
        readInt(screen, "screen", "textWidth", 1, kMaxTextCellSize, m_screen.textWidth);
        readInt(screen, "screen", "textHeight", 1, kMaxTextCellSize, m_screen.textHeight);

        if (screen.contains("borderStyle")) {
            const json& style = screen["borderStyle"];
            if (style.is_string() && IsKnownBorderStyle(style.get<std::string>())) {
                m_screen.borderStyle = ToLower(style.get<std::string>());
            } else {
                m_warnings.push_back("Unknown screen.borderStyle, using single");
            }
        }
    }

    if (root.contains("sixel") && root["sixel"].is_object()) {
        const json& sixel = root["sixel"];

        int paletteSize = m_sixel.paletteSize;
        readInt(sixel, "sixel", "paletteSize", Graphics::SixelOptions::MIN_PALETTE_SIZE,
                Graphics::SixelOptions::MAX_PALETTE_SIZE, paletteSize);
        if (Graphics::SixelOptions::IsValidPaletteSize(paletteSize)) {
            m_sixel.paletteSize = paletteSize;
        } else {
            m_warnings.push_back("sixel.paletteSize must be a power of two, using default");
        }

        readBool(sixel, "sixel", "fastMode", m_sixel.fastMode);
        readInt(sixel, "sixel", "alphaThreshold", 0, 255, m_sixel.alphaThreshold);
        readInt(sixel, "sixel", "samplesPerColor", 0, 1 << 20, m_sixel.samplesPerColor);
        readInt(sixel, "sixel", "colorCacheSize", 0, kMaxColorCacheSize, m_sixel.colorCacheSize);
        readBool(sixel, "sixel", "dither", m_sixel.dither);
        readBool(sixel, "sixel", "allowTransparency", m_sixel.allowTransparency);
    }

    if (root.contains("logging") && root["logging"].is_object()) {
        const json& logging = root["logging"];
        if (logging.contains("level")) {
            const json& level = logging["level"];
            if (level.is_string() && ParseLogLevel(level.get<std::string>())) {
                m_logging.level = ToLower(level.get<std::string>());
            } else {
                m_warnings.push_back("Unknown logging.level, using info");
            }
        }
    }

    return true;
}

bool Config::Save(const std::string& path) const {
    json root;

    root["screen"] = {
        {"width", m_screen.width},
        {"height", m_screen.height},
        {"textWidth", m_screen.textWidth},
        {"textHeight", m_screen.textHeight},
        {"borderStyle", m_screen.borderStyle}
    };

    root["sixel"] = {
        {"paletteSize", m_sixel.paletteSize},
        {"fastMode", m_sixel.fastMode},
        {"alphaThreshold", m_sixel.alphaThreshold},
        {"samplesPerColor", m_sixel.samplesPerColor},
        {"colorCacheSize", m_sixel.colorCacheSize},
        {"dither", m_sixel.dither},
        {"allowTransparency", m_sixel.allowTransparency}
    };

    root["logging"] = {
        {"level", m_logging.level}
    };

    std::filesystem::path filePath(path);
    if (filePath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
        if (ec) {
            spdlog::error("Could not create config directory {}: {}",
                          filePath.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) {
        spdlog::error("Could not write config file {}", path);
        return false;
    }
    file << root.dump(4) << '\n';
    return static_cast<bool>(file);
}

Graphics::SixelOptions Config::GetSixelOptions() const {
    Graphics::SixelOptions options;
    options.paletteSize = m_sixel.paletteSize;
    options.fastMode = m_sixel.fastMode;
    options.alphaThreshold = m_sixel.alphaThreshold;
    options.samplesPerColor = m_sixel.samplesPerColor;
    options.colorCacheSize = m_sixel.colorCacheSize;
    options.dither = m_sixel.dither;
    options.allowTransparency = m_sixel.allowTransparency;
    return options;
}

const Terminal::BorderStyle& Config::GetBorderStyle() const {
    return Terminal::BorderStyle::FromName(m_screen.borderStyle);
}

void Config::ApplyTo(Terminal::LogicalScreen& screen) const {
    if (screen.GetWidth() != m_screen.width || screen.GetHeight() != m_screen.height) {
        screen.SetDimensions(m_screen.width, m_screen.height);
    }
    screen.SetTextCellSize(m_screen.textWidth, m_screen.textHeight);
    screen.SetBorderStyle(GetBorderStyle());
}

std::shared_ptr<Terminal::LogicalScreen> Config::CreateScreen() const {
    auto screen = std::make_shared<Terminal::LogicalScreen>(m_screen.width, m_screen.height);
    ApplyTo(*screen);
    return screen;
}

std::optional<spdlog::level::level_enum> Config::ParseLogLevel(const std::string& name) {
    std::string lower = ToLower(name);
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

void Config::ApplyLogLevel() const {
    auto level = ParseLogLevel(m_logging.level);
    spdlog::set_level(level.value_or(spdlog::level::info));
}

} // namespace TermCanvas::Core
