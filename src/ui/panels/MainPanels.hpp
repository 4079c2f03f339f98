#pragma once

#include "ui/AppState.hpp"

namespace todopad::ui {

// Components
void DrawTaskInput(AppState& app);
void DrawTaskList(AppState& app, float height);
void DrawEditActions(AppState& app);
void DrawStatusBar(AppState& app);
void DrawActivityLog(AppState& app);

// Main Blocks
void DrawMenuBar(AppState& app);
void DrawMainWindow(AppState& app);

} // namespace todopad::ui
