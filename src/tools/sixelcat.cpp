// sixelcat: print image files to a sixel-capable terminal
//
//   sixelcat [-v|-vv] [--palette N] [--fast] [--config FILE] file...

#include "core/Config.h"
#include "graphics/Bitmap.h"
#include "graphics/SixelEncoder.h"
#include "terminal/LogicalScreen.h"
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

using namespace TermCanvas;

namespace {

// Each image carries its own palette
constexpr const char* kPrivatePaletteOn = "\033[?1070h";

void PrintUsage() {
    std::fprintf(stderr,
                 "USAGE: sixelcat [-v | -vv] [--palette N] [--fast] [--config FILE] file...\n");
}

bool EncodeFile(Graphics::SixelEncoder& encoder, const Terminal::LogicalScreen& screen,
                const std::string& path) {
    int width = 0;
    int height = 0;
    int channels = 0;
    unsigned char* pixels = stbi_load(path.c_str(), &width, &height, &channels, 4);
    if (!pixels) {
        spdlog::error("Error loading {}: {}", path, stbi_failure_reason());
        return false;
    }

    Graphics::Bitmap bitmap = Graphics::Bitmap::FromRgba(width, height, pixels, 4);
    stbi_image_free(pixels);

    Graphics::SixelResult result = encoder.Encode(bitmap);
    if (!result.IsOk()) {
        spdlog::error("Error encoding {}: {}", path, result.errorMessage);
        return false;
    }

    spdlog::info("{}: {}x{}, {} colors ({})", path, width, height, result.paletteColors,
                 Graphics::ToString(result.quantization));

    // Text cells the image covers at the configured cell size
    int cellsX = (width + screen.GetTextWidth() - 1) / screen.GetTextWidth();
    int cellsY = (height + screen.GetTextHeight() - 1) / screen.GetTextHeight();
    spdlog::debug("{}: spans {}x{} cells of {}x{}", path, cellsX, cellsY,
                  screen.GetWidth(), screen.GetHeight());

    std::string dcs = Graphics::SixelEncoder::ToDcs(result);
    std::fwrite(dcs.data(), 1, dcs.size(), stdout);
    std::fflush(stdout);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    // Log to stderr so stdout carries only the image data
    spdlog::set_default_logger(spdlog::stderr_color_mt("sixelcat"));
    spdlog::set_level(spdlog::level::warn);

    std::string configPath;
    std::vector<std::string> files;
    int verbosity = 0;
    int paletteSize = 0;
    bool fastMode = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v") {
            verbosity = 1;
        } else if (arg == "-vv") {
            verbosity = 2;
        } else if (arg == "--fast") {
            fastMode = true;
        } else if (arg == "--palette" && i + 1 < argc) {
            paletteSize = std::atoi(argv[++i]);
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage();
            return 0;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty()) {
        PrintUsage();
        return -1;
    }

    Core::Config config;
    if (!configPath.empty()) {
        if (!config.Load(configPath)) {
            spdlog::error("Could not load config {}, using defaults", configPath);
        }
        config.ApplyLogLevel();
    }
    if (verbosity == 1) {
        spdlog::set_level(spdlog::level::debug);
    } else if (verbosity == 2) {
        spdlog::set_level(spdlog::level::trace);
    }

    auto screen = config.CreateScreen();
    Graphics::SixelEncoder encoder(config.GetSixelOptions());
    if (paletteSize != 0 && !encoder.SetPaletteSize(paletteSize)) {
        PrintUsage();
        return -1;
    }
    if (fastMode) {
        encoder.SetFastMode(true);
    }

    std::fputs(kPrivatePaletteOn, stdout);
    std::fflush(stdout);

    int failures = 0;
    for (const auto& file : files) {
        if (!EncodeFile(encoder, *screen, file)) {
            ++failures;
        }
    }

    std::fputs(kPrivatePaletteOn, stdout);
    std::fflush(stdout);
    return failures;
}
