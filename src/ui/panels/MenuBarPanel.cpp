#include "ui/panels/MainPanels.hpp"
#include "imgui.h"

namespace todopad::ui {

void DrawMenuBar(AppState& app) {
    const domain::TaskStats stats = app.tasks.GetStats();

    if (ImGui::BeginMenuBar()) {
        if (ImGui::BeginMenu("File")) {
            if (ImGui::MenuItem("Save Changes", nullptr, false, stats.editing > 0)) {
                app.CommitAllEdits();
            }
            if (ImGui::MenuItem("Clear Completed", nullptr, false, stats.completed > 0)) {
                app.ClearCompleted();
            }
            ImGui::Separator();
            if (ImGui::MenuItem("Quit", "Alt+F4")) {
                app.ui.requestExit = true;
            }
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("View")) {
            if (ImGui::MenuItem("Show Completed", nullptr, app.ui.showCompleted)) {
                app.ui.showCompleted = !app.ui.showCompleted;
            }
            if (ImGui::MenuItem("Activity Log", nullptr, app.ui.showLog)) {
                app.ui.showLog = !app.ui.showLog;
            }
            ImGui::EndMenu();
        }
        ImGui::EndMenuBar();
    }
}

} // namespace todopad::ui
