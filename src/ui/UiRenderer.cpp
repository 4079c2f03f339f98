/**
 * @file UiRenderer.cpp
 * @brief Frame entry point; delegates to the panels.
 */
#include "ui/UiRenderer.hpp"
#include "ui/panels/MainPanels.hpp"

namespace todopad::ui {

void DrawUI(AppState& app) {
    DrawMainWindow(app);
}

} // namespace todopad::ui
