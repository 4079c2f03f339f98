/**
 * @file TodoPadApp.hpp
 * @brief Main application class for TodoPad.
 */

#pragma once

#include "ui/AppState.hpp"

struct SDL_Window;

namespace todopad::app {

/**
 * @class TodoPadApp
 * @brief Orchestrates the application lifecycle, including initialization, the main loop, and shutdown.
 */
class TodoPadApp {
public:
    /**
     * @brief Starts the application main loop.
     * @return Exit code (0 on normal window close, -1 if initialization failed).
     */
    int Run();

private:
    /**
     * @brief Loads settings and initializes SDL, OpenGL and ImGui.
     * @return True if initialization succeeded.
     */
    bool Init();

    /**
     * @brief Cleans up all resources before exiting.
     */
    void Shutdown();

    ui::AppState m_state; ///< Task list and UI state handed to the renderer each frame.
    SDL_Window* m_window = nullptr; ///< SDL window handle.
    void* m_glContext = nullptr; ///< OpenGL context.
    bool m_sdlInitialized = false; ///< Flag indicating SDL initialization status.
    bool m_imguiInitialized = false; ///< Flag indicating ImGui initialization status.
};

} // namespace todopad::app
