#include "ui/AppState.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace todopad::ui {

namespace {

std::string Quote(const std::string& text) {
    return "\"" + text + "\"";
}

} // namespace

bool AppState::SubmitNewTask() {
    auto id = tasks.Add(ui.newTaskInput);
    if (!id) {
        AppendLog("[Tasks] Ignored blank task.\n");
        return false;
    }
    const domain::Task* task = tasks.Find(*id);
    AppendLog("[Tasks] Added #" + std::to_string(*id) + " " + Quote(task->text) + "\n");
    ui.newTaskInput.clear();
    return true;
}

void AppState::BeginEdit(domain::TaskId id) {
    const domain::Task* task = tasks.Find(id);
    if (!task || task->isEditing) return;

    tasks.BeginEdit(id);
    ui.drafts[id] = task->text;
}

bool AppState::CommitEdit(domain::TaskId id) {
    auto it = ui.drafts.find(id);
    if (it == ui.drafts.end()) {
        return false;
    }
    if (!tasks.CommitEdit(id, it->second)) {
        if (tasks.Find(id)) {
            AppendLog("[Tasks] Edit of #" + std::to_string(id) + " refused: text is blank.\n");
        } else {
            ui.drafts.erase(it);
        }
        return false;
    }
    AppendLog("[Tasks] Edited #" + std::to_string(id) + " -> " + Quote(it->second) + "\n");
    ui.drafts.erase(it);
    return true;
}

void AppState::CancelEdit(domain::TaskId id) {
    tasks.CancelEdit(id);
    ui.drafts.erase(id);
}

std::size_t AppState::CommitAllEdits() {
    std::vector<domain::TaskId> open;
    for (const auto& [id, draft] : ui.drafts) {
        open.push_back(id);
    }
    std::size_t committed = 0;
    for (domain::TaskId id : open) {
        if (CommitEdit(id)) committed++;
    }
    return committed;
}

void AppState::CancelAllEdits() {
    for (const auto& [id, draft] : ui.drafts) {
        tasks.CancelEdit(id);
    }
    ui.drafts.clear();
}

void AppState::ToggleComplete(domain::TaskId id) {
    if (!tasks.ToggleComplete(id)) return;

    const domain::Task* task = tasks.Find(id);
    AppendLog(std::string("[Tasks] ") + (task->isCompleted ? "Completed #" : "Reopened #")
              + std::to_string(id) + "\n");
}

void AppState::DeleteTask(domain::TaskId id) {
    ui.drafts.erase(id);
    if (tasks.Delete(id)) {
        AppendLog("[Tasks] Deleted #" + std::to_string(id) + "\n");
    }
}

void AppState::ClearCompleted() {
    for (const auto& task : tasks.GetTasks()) {
        if (task.isCompleted) ui.drafts.erase(task.id);
    }
    std::size_t removed = tasks.ClearCompleted();
    if (removed > 0) {
        AppendLog("[Tasks] Cleared " + std::to_string(removed) + " completed task(s).\n");
    }
}

std::string& AppState::DraftFor(domain::TaskId id) {
    auto it = ui.drafts.find(id);
    if (it != ui.drafts.end()) {
        return it->second;
    }
    const domain::Task* task = tasks.Find(id);
    return ui.drafts[id] = task ? task->text : std::string();
}

void AppState::AppendLog(const std::string& line) {
    ui.outputLog += line;
    ui.outputLogLines += static_cast<std::size_t>(std::count(line.begin(), line.end(), '\n'));
    std::cout << line << std::flush;

    while (ui.outputLogLines > kMaxLogLines) {
        const size_t nl = ui.outputLog.find('\n');
        ui.outputLog.erase(0, nl + 1);
        ui.outputLogLines--;
    }
}

int AppState::FooterRows() const {
    return tasks.GetTasks().empty() ? 1 : 2;
}

} // namespace todopad::ui
