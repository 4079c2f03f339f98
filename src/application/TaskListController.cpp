#include "application/TaskListController.hpp"

#include "domain/TaskText.hpp"

#include <algorithm>

namespace todopad::application {

std::optional<domain::TaskId> TaskListController::Add(const std::string& text) {
    std::string trimmed = domain::TrimTaskText(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    const domain::TaskId id = m_nextId++;
    m_tasks.emplace_back(id, trimmed);
    return id;
}

bool TaskListController::BeginEdit(domain::TaskId id) {
    domain::Task* task = FindMutable(id);
    if (!task) return false;

    task->isEditing = true;
    return true;
}

bool TaskListController::CommitEdit(domain::TaskId id, const std::string& newText) {
    domain::Task* task = FindMutable(id);
    if (!task) return false;
    if (domain::IsBlankTaskText(newText)) return false;

    task->text = newText;
    task->isEditing = false;
    return true;
}

bool TaskListController::CancelEdit(domain::TaskId id) {
    domain::Task* task = FindMutable(id);
    if (!task) return false;

    task->isEditing = false;
    return true;
}

bool TaskListController::ToggleComplete(domain::TaskId id) {
    domain::Task* task = FindMutable(id);
    if (!task) return false;

    task->isCompleted = !task->isCompleted;
    return true;
}

bool TaskListController::Delete(domain::TaskId id) {
    auto it = std::find_if(m_tasks.begin(), m_tasks.end(),
                           [id](const domain::Task& t) { return t.id == id; });
    if (it == m_tasks.end()) {
        return false;
    }
    m_tasks.erase(it);
    return true;
}

std::size_t TaskListController::ClearCompleted() {
    const std::size_t before = m_tasks.size();
    m_tasks.erase(std::remove_if(m_tasks.begin(), m_tasks.end(),
                                 [](const domain::Task& t) { return t.isCompleted; }),
                  m_tasks.end());
    return before - m_tasks.size();
}

const domain::Task* TaskListController::Find(domain::TaskId id) const {
    for (const auto& task : m_tasks) {
        if (task.id == id) {
            return &task;
        }
    }
    return nullptr;
}

domain::Task* TaskListController::FindMutable(domain::TaskId id) {
    for (auto& task : m_tasks) {
        if (task.id == id) {
            return &task;
        }
    }
    return nullptr;
}

domain::TaskStats TaskListController::GetStats() const {
    domain::TaskStats stats;
    stats.total = m_tasks.size();
    for (const auto& task : m_tasks) {
        if (task.isCompleted) stats.completed++;
        if (task.isEditing) stats.editing++;
    }
    stats.pending = stats.total - stats.completed;
    return stats;
}

bool TaskListController::IsEditingAny() const {
    return std::any_of(m_tasks.begin(), m_tasks.end(),
                       [](const domain::Task& t) { return t.isEditing; });
}

} // namespace todopad::application
