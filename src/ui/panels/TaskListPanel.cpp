#include "ui/panels/MainPanels.hpp"
#include "ui/UiUtils.hpp"
#include "imgui.h"
#include <string>
#include <vector>

namespace todopad::ui {

namespace {
constexpr float kInputWidth = 300.0f;
constexpr float kMultilineRows = 3.0f;
const ImVec4 kCompletedTextColor(0.55f, 0.55f, 0.55f, 1.0f);
const ImVec4 kEditMarkerColor(1.0f, 0.8f, 0.0f, 1.0f);
}

void DrawTaskInput(AppState& app) {
    bool submit = false;

    if (app.config.multilineInput) {
        ImGui::TextDisabled("Enter a new task...");
        float height = ImGui::GetTextLineHeight() * kMultilineRows + ImGui::GetStyle().FramePadding.y * 2.0f;
        InputTextMultilineString("##newtask", &app.ui.newTaskInput, ImVec2(kInputWidth, height));
        submit = ImGui::Button("Add Task");
    } else {
        ImGui::SetNextItemWidth(kInputWidth);
        submit = InputTextString("##newtask", "Enter a new task...", &app.ui.newTaskInput,
                                 ImGuiInputTextFlags_EnterReturnsTrue);
        if (submit) {
            ImGui::SetKeyboardFocusHere(-1);
        }
        ImGui::SameLine();
        submit = ImGui::Button("Add Task") || submit;
    }

    if (submit) {
        app.SubmitNewTask();
    }
}

void DrawTaskList(AppState& app, float height) {
    auto label = [&app](const char* withEmoji, const char* plain) {
        return app.ui.emojiEnabled ? withEmoji : plain;
    };

    ImGui::BeginChild("TaskList", ImVec2(0, height), true);
    ImGui::Text("Task List:");

    const auto& tasks = app.tasks.GetTasks();
    if (tasks.empty()) {
        ImGui::TextDisabled("No tasks yet.");
    }

    // Rows are keyed by task id; removals wait until every row is drawn.
    std::vector<domain::TaskId> toRemove;
    std::vector<domain::TaskId> toCommit;
    std::vector<domain::TaskId> toCancel;

    const char* deleteCaption = label("🗑", "Delete");
    const ImGuiStyle& style = ImGui::GetStyle();

    for (const auto& task : tasks) {
        if (!app.ui.showCompleted && task.isCompleted && !task.isEditing) {
            continue;
        }

        ImGui::PushID(std::to_string(task.id).c_str());

        bool completed = task.isCompleted;
        if (ImGui::Checkbox("##done", &completed)) {
            app.ToggleComplete(task.id);
        }
        ImGui::SameLine();

        if (task.isEditing) {
            ImGui::TextColored(kEditMarkerColor, "%s", label("✏️", "*"));
            ImGui::SameLine();

            float buttons = ButtonWidth("Save") + ButtonWidth("Cancel") + ButtonWidth(deleteCaption)
                + style.ItemSpacing.x * 3.0f;
            std::string& draft = app.DraftFor(task.id);
            bool enter = false;
            if (app.config.multilineInput) {
                float rows = ImGui::GetTextLineHeight() * kMultilineRows + style.FramePadding.y * 2.0f;
                InputTextMultilineString("##edit", &draft, ImVec2(-buttons, rows));
            } else {
                ImGui::SetNextItemWidth(-buttons);
                enter = InputTextString("##edit", "Task text", &draft, ImGuiInputTextFlags_EnterReturnsTrue);
            }
            ImGui::SameLine();
            if (ImGui::Button("Save") || enter) {
                toCommit.push_back(task.id);
            }
            ImGui::SameLine();
            if (ImGui::Button("Cancel")) {
                toCancel.push_back(task.id);
            }
        } else {
            float buttons = ButtonWidth("Edit") + ButtonWidth(deleteCaption) + style.ItemSpacing.x * 2.0f;
            const float startX = ImGui::GetCursorPosX();
            float textWidth = ImGui::GetContentRegionAvail().x - buttons;
            ImGui::PushTextWrapPos(startX + (textWidth > 1.0f ? textWidth : 1.0f));
            if (task.isCompleted) {
                ImGui::PushStyleColor(ImGuiCol_Text, kCompletedTextColor);
                ImGui::TextUnformatted(task.text.c_str());
                ImGui::PopStyleColor();
            } else {
                ImGui::TextUnformatted(task.text.c_str());
            }
            ImGui::PopTextWrapPos();

            ImGui::SameLine(startX + textWidth + style.ItemSpacing.x);
            if (ImGui::Button("Edit")) {
                app.BeginEdit(task.id);
            }
        }

        ImGui::SameLine();
        if (ImGui::Button(deleteCaption)) {
            toRemove.push_back(task.id);
        }
        if (app.ui.emojiEnabled && ImGui::IsItemHovered()) {
            ImGui::SetTooltip("Delete task");
        }

        ImGui::PopID();
    }

    ImGui::EndChild();

    for (domain::TaskId id : toCommit) {
        app.CommitEdit(id);
    }
    for (domain::TaskId id : toCancel) {
        app.CancelEdit(id);
    }
    for (domain::TaskId id : toRemove) {
        app.DeleteTask(id);
    }
}

void DrawEditActions(AppState& app) {
    if (!app.tasks.IsEditingAny()) {
        return;
    }
    if (ImGui::Button("Save Changes")) {
        app.CommitAllEdits();
    }
    ImGui::SameLine();
    if (ImGui::Button("Cancel All")) {
        app.CancelAllEdits();
    }
}

} // namespace todopad::ui
