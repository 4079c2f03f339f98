#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"

using todopad::infrastructure::AppConfig;
using todopad::infrastructure::ConfigLoader;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    std::string testRoot = "test_config_root";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    // Missing file
    AppConfig defaults = ConfigLoader::Load(testRoot);
    assert(defaults.windowTitle == "To-Do List");
    assert(defaults.windowWidth == 640);
    assert(defaults.windowHeight == 720);
    assert(defaults.darkTheme);
    assert(!defaults.multilineInput);
    assert(!defaults.videoDriver);

    // Full file
    {
        std::ofstream f(std::filesystem::path(testRoot) / ConfigLoader::kSettingsFile);
        f << R"({
            "window_title": "Groceries",
            "window_width": 800,
            "window_height": 600,
            "theme": "light",
            "multiline_input": true,
            "video_driver": "x11"
        })";
    }
    AppConfig full = ConfigLoader::Load(testRoot);
    assert(full.windowTitle == "Groceries");
    assert(full.windowWidth == 800);
    assert(full.windowHeight == 600);
    assert(!full.darkTheme);
    assert(full.multilineInput);
    assert(full.videoDriver && *full.videoDriver == "x11");

    // Malformed document
    AppConfig broken = ConfigLoader::Parse("{ \"window_title\": ");
    assert(broken.windowTitle == "To-Do List");
    assert(broken.darkTheme);

    // Not an object
    AppConfig array = ConfigLoader::Parse("[1, 2, 3]");
    assert(array.windowWidth == 640);

    // Wrong types and out-of-range values keep their defaults; valid keys still apply.
    AppConfig mixed = ConfigLoader::Parse(R"({
        "window_title": 42,
        "window_width": -5,
        "window_height": "tall",
        "theme": "sepia",
        "multiline_input": true,
        "video_driver": "directfb"
    })");
    assert(mixed.windowTitle == "To-Do List");
    assert(mixed.windowWidth == 640);
    assert(mixed.windowHeight == 720);
    assert(mixed.darkTheme);
    assert(mixed.multilineInput);
    assert(!mixed.videoDriver);

    // Window sizes must be integers that fit in an int.
    AppConfig fractional = ConfigLoader::Parse(R"({"window_width": 800.9, "window_height": 600.0})");
    assert(fractional.windowWidth == 640);
    assert(fractional.windowHeight == 720);

    AppConfig wrapped = ConfigLoader::Parse(R"({"window_width": 4294967297, "window_height": 2147483648})");
    assert(wrapped.windowWidth == 640);
    assert(wrapped.windowHeight == 720);

    AppConfig huge = ConfigLoader::Parse(R"({"window_width": 1e12, "window_height": -4294967297})");
    assert(huge.windowWidth == 640);
    assert(huge.windowHeight == 720);

    AppConfig largest = ConfigLoader::Parse(R"({"window_width": 2147483647, "window_height": 1})");
    assert(largest.windowWidth == 2147483647);
    assert(largest.windowHeight == 1);

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
