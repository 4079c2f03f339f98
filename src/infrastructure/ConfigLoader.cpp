/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>

namespace todopad::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) {
        return;
    }
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

/**
 * @brief Reads a window dimension. Only integers in [1, INT_MAX] are accepted;
 * anything else is reported and @p out keeps its value.
 */
void ReadWindowSize(const nlohmann::json& j, const char* key, int& out) {
    if (!j.contains(key)) {
        return;
    }
    const nlohmann::json& value = j.at(key);
    if (!value.is_number_integer()) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected an integer." << std::endl;
        return;
    }

    constexpr std::int64_t kMax = std::numeric_limits<int>::max();
    bool inRange = false;
    std::int64_t size = 0;
    if (value.is_number_unsigned()) {
        const std::uint64_t raw = value.get<std::uint64_t>();
        inRange = raw <= static_cast<std::uint64_t>(kMax);
        size = static_cast<std::int64_t>(inRange ? raw : 0);
    } else {
        size = value.get<std::int64_t>();
        inRange = size <= kMax;
    }
    if (!inRange || size <= 0) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << value.dump() << " is not a valid window size." << std::endl;
        return;
    }
    out = static_cast<int>(size);
}

} // namespace

AppConfig ConfigLoader::Parse(const std::string& jsonText) {
    AppConfig config;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(jsonText);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return config;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json must contain an object, using defaults." << std::endl;
        return config;
    }

    ReadKey(j, "window_title", config.windowTitle);
    ReadKey(j, "multiline_input", config.multilineInput);

    ReadWindowSize(j, "window_width", config.windowWidth);
    ReadWindowSize(j, "window_height", config.windowHeight);

    std::string theme = "dark";
    ReadKey(j, "theme", theme);
    if (theme == "light") {
        config.darkTheme = false;
    } else if (theme != "dark") {
        std::cerr << "[ConfigLoader] Unknown theme '" << theme << "', using dark." << std::endl;
    }

    std::string driver;
    ReadKey(j, "video_driver", driver);
    if (driver == "x11" || driver == "wayland") {
        config.videoDriver = driver;
    } else if (!driver.empty()) {
        std::cerr << "[ConfigLoader] Unsupported video_driver '" << driver << "', ignored." << std::endl;
    }

    return config;
}

AppConfig ConfigLoader::Load(const std::string& configDir) {
    std::filesystem::path configPath = std::filesystem::path(configDir) / kSettingsFile;
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        return AppConfig{};
    }

    std::ifstream f(configPath);
    if (!f) {
        std::cerr << "[ConfigLoader] Cannot open " << configPath.string() << ", using defaults." << std::endl;
        return AppConfig{};
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return Parse(buffer.str());
}

} // namespace todopad::infrastructure
