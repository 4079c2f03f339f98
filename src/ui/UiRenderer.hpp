/**
 * @file UiRenderer.hpp
 * @brief Main entry point for the Dear ImGui UI rendering.
 */

#pragma once

#include "ui/AppState.hpp"

namespace todopad::ui {

/**
 * @brief Main UI rendering entry point. Call once per frame.
 * @param app The application state; every widget action mutates it synchronously.
 */
void DrawUI(AppState& app);

} // namespace todopad::ui
