/**
 * @file TodoPadApp.cpp
 * @brief Implementation of the TodoPadApp class.
 */
#include "app/TodoPadApp.hpp"

#include "ui/UiRenderer.hpp"
#include "infrastructure/ConfigLoader.hpp"

#include "imgui.h"
#include "imgui_impl_opengl3.h"
#include "imgui_impl_sdl2.h"

#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>

#include <cstdio>
#include <iostream>
#include <filesystem>
#include <string>
#include <vector>

namespace todopad::app {

namespace {

std::string FindFontPath(const std::vector<const char*>& candidates) {
    for (const char* path : candidates) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            return path;
        }
    }
    return {};
}

/**
 * @brief Loads a base UI font and merges an emoji font for the row icons.
 * @return True if the emoji font was merged.
 */
bool LoadFonts(ImGuiIO& io) {
    const float baseFontSize = 16.0f;

#if defined(_WIN32)
    const std::vector<const char*> baseCandidates = {
        "C:\\Windows\\Fonts\\segoeui.ttf",
    };
    const std::vector<const char*> emojiCandidates = {
        "assets/fonts/NotoEmoji-Regular.ttf",
        "C:\\Windows\\Fonts\\seguiemj.ttf",
    };
#elif defined(__APPLE__)
    const std::vector<const char*> baseCandidates = {
        "/System/Library/Fonts/Supplemental/Arial.ttf",
    };
    const std::vector<const char*> emojiCandidates = {
        "assets/fonts/NotoEmoji-Regular.ttf",
        "/System/Library/Fonts/Apple Color Emoji.ttc",
    };
#else
    const std::vector<const char*> baseCandidates = {
        "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
        "/usr/share/fonts/TTF/NotoSans-Regular.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    };
    const std::vector<const char*> emojiCandidates = {
        "assets/fonts/NotoEmoji-Regular.ttf",
        "/usr/share/fonts/google-noto-emoji-fonts/NotoEmoji-Regular.ttf",
        "/usr/share/fonts/truetype/noto/NotoEmoji-Regular.ttf",
        "/usr/share/fonts/TTF/NotoEmoji-Regular.ttf",
    };
#endif

    std::string basePath = FindFontPath(baseCandidates);
    ImFont* baseFont = nullptr;
    if (!basePath.empty()) {
        baseFont = io.Fonts->AddFontFromFileTTF(basePath.c_str(), baseFontSize);
    }
    if (!baseFont) {
        baseFont = io.Fonts->AddFontDefault();
    }
    io.FontDefault = baseFont;

#if !defined(IMGUI_USE_WCHAR32)
    // The wastebasket glyph lies outside the 16-bit ImWchar range.
    (void)emojiCandidates;
    std::cerr << "[TodoPadApp] ImGui built without IMGUI_USE_WCHAR32, using text labels for row icons." << std::endl;
    return false;
#else
    std::string emojiPath = FindFontPath(emojiCandidates);
    if (emojiPath.empty()) {
        std::cerr << "[TodoPadApp] WARNING: No emoji font found, using text labels for row icons." << std::endl;
        return false;
    }

    std::cout << "[TodoPadApp] Found Emoji Font: " << emojiPath << std::endl;
    ImFontConfig config;
    config.MergeMode = true;
    config.PixelSnapH = true;

    // U+270F pencil, U+FE0F variation selector, U+1F5D1 wastebasket.
    static const ImWchar emojiRanges[] = {
        0x2700, 0x27BF,
        0xFE00, 0xFE0F,
        0x1F5D1, 0x1F5D1,
        0
    };

    ImFont* emojiFont = io.Fonts->AddFontFromFileTTF(emojiPath.c_str(), baseFontSize, &config, emojiRanges);
    return emojiFont != nullptr;
#endif
}

} // namespace

bool TodoPadApp::Init() {
    const std::string workingDir = std::filesystem::current_path().string();
    m_state.config = infrastructure::ConfigLoader::Load(workingDir);
    const infrastructure::AppConfig& config = m_state.config;

    if (config.videoDriver) {
        std::cout << "[TodoPadApp] Enforcing " << *config.videoDriver << " video driver via settings.json" << std::endl;
        SDL_SetHint(SDL_HINT_VIDEODRIVER, config.videoDriver->c_str());
    }

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }
    m_sdlInitialized = true;

    const char* glsl_version = "#version 130";
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);

    SDL_WindowFlags window_flags = (SDL_WindowFlags)(SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    m_window = SDL_CreateWindow(config.windowTitle.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                config.windowWidth, config.windowHeight, window_flags);
    if (!m_window) {
        std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        return false;
    }

    m_glContext = SDL_GL_CreateContext(m_window);
    if (!m_glContext) {
        std::fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        return false;
    }
    SDL_GL_MakeCurrent(m_window, m_glContext);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    m_state.ui.emojiEnabled = LoadFonts(io);
    if (config.darkTheme) {
        ImGui::StyleColorsDark();
    } else {
        ImGui::StyleColorsLight();
    }

    if (!ImGui_ImplSDL2_InitForOpenGL(m_window, m_glContext)) {
        std::fprintf(stderr, "ImGui_ImplSDL2_InitForOpenGL failed.\n");
        return false;
    }
    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        std::fprintf(stderr, "ImGui_ImplOpenGL3_Init failed.\n");
        ImGui_ImplSDL2_Shutdown();
        return false;
    }
    m_imguiInitialized = true;

    m_state.AppendLog("[System] TodoPad started.\n");
    return true;
}

void TodoPadApp::Shutdown() {
    if (m_imguiInitialized) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        m_imguiInitialized = false;
    }
    if (ImGui::GetCurrentContext()) {
        ImGui::DestroyContext();
    }

    if (m_glContext) {
        SDL_GL_DeleteContext(m_glContext);
        m_glContext = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
    if (m_sdlInitialized) {
        SDL_Quit();
        m_sdlInitialized = false;
    }
}

int TodoPadApp::Run() {
    if (!Init()) {
        Shutdown();
        return -1;
    }

    bool done = false;
    while (!done) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT) done = true;
            if (event.type == SDL_WINDOWEVENT && event.window.event == SDL_WINDOWEVENT_CLOSE
                && event.window.windowID == SDL_GetWindowID(m_window)) {
                done = true;
            }
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        ui::DrawUI(m_state);
        if (m_state.ui.requestExit) {
            done = true;
        }

        ImGui::Render();
        ImGuiIO& io = ImGui::GetIO();
        glViewport(0, 0, static_cast<int>(io.DisplaySize.x), static_cast<int>(io.DisplaySize.y));
        if (m_state.config.darkTheme) {
            glClearColor(0.10f, 0.10f, 0.10f, 1.00f);
        } else {
            glClearColor(0.94f, 0.94f, 0.94f, 1.00f);
        }
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(m_window);
    }

    Shutdown();
    return 0;
}

} // namespace todopad::app
