#include "ui/panels/MainPanels.hpp"
#include "imgui.h"

namespace todopad::ui {

void DrawStatusBar(AppState& app) {
    const domain::TaskStats stats = app.tasks.GetStats();

    ImGui::Text("Tasks: %zu total | %zu completed", stats.total, stats.completed);
    ImGui::SameLine();
    ImGui::Checkbox("Show Done", &app.ui.showCompleted);
    ImGui::SameLine();

    const bool nothingDone = (stats.completed == 0);
    if (nothingDone) ImGui::BeginDisabled();
    if (ImGui::Button("Clear Completed")) {
        app.ClearCompleted();
    }
    if (nothingDone) ImGui::EndDisabled();

    ImGui::SameLine();
    ImGui::Checkbox("Log", &app.ui.showLog);
}

void DrawActivityLog(AppState& app) {
    if (!app.ui.showLog) {
        return;
    }
    ImGui::BeginChild("ActivityLog", ImVec2(0, 0), true);
    ImGui::TextUnformatted(app.ui.outputLog.c_str());
    if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY())
        ImGui::SetScrollHereY(1.0f);
    ImGui::EndChild();
}

} // namespace todopad::ui
