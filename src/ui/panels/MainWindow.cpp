#include "ui/panels/MainPanels.hpp"
#include "imgui.h"

namespace todopad::ui {

namespace {
constexpr float kLogHeight = 140.0f;
constexpr float kMinListHeight = 80.0f;
}

void DrawMainWindow(AppState& app) {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGui::Begin("Main", NULL, ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_MenuBar);

    DrawMenuBar(app);

    ImGui::Text("To-Do List");
    ImGui::Separator();

    DrawTaskInput(app);
    ImGui::Separator();

    // Reserve room below the list for the edit actions, status bar and log.
    // An Edit click inside the list shows the edit actions in this same frame.
    const float rowHeight = ImGui::GetFrameHeightWithSpacing();
    float footer = rowHeight * static_cast<float>(app.FooterRows());
    if (app.ui.showLog) footer += kLogHeight + ImGui::GetStyle().ItemSpacing.y;

    float listHeight = ImGui::GetContentRegionAvail().y - footer;
    if (listHeight < kMinListHeight) listHeight = kMinListHeight;

    DrawTaskList(app, listHeight);
    DrawEditActions(app);
    DrawStatusBar(app);
    DrawActivityLog(app);

    ImGui::End();
}

} // namespace todopad::ui
