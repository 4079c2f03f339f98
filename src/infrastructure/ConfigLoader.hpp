/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Keeps JSON parsing in one place; the rest of the application only sees
 * the AppConfig struct.
 */

#pragma once

#include <optional>
#include <string>

namespace todopad::infrastructure {

/**
 * @struct AppConfig
 * @brief Window and input preferences. Every field has a usable default.
 */
struct AppConfig {
    std::string windowTitle = "To-Do List";
    int windowWidth = 640;
    int windowHeight = 720;
    bool darkTheme = true;
    bool multilineInput = false;
    std::optional<std::string> videoDriver; ///< "x11" or "wayland" when forced.
};

class ConfigLoader {
public:
    /** @brief Name of the settings file looked up in the config directory. */
    static constexpr const char* kSettingsFile = "settings.json";

    /**
     * @brief Reads settings.json from @p configDir.
     * A missing file yields defaults. Parse errors and wrong-typed keys are
     * reported on stderr and the affected values keep their defaults.
     */
    static AppConfig Load(const std::string& configDir);

    /**
     * @brief Parses a settings document held in memory.
     * Same fallback rules as Load().
     */
    static AppConfig Parse(const std::string& jsonText);
};

} // namespace todopad::infrastructure
