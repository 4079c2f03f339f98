/**
 * @file TaskListController.hpp
 * @brief Owner of the task list and the only mutation surface for it.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "domain/Task.hpp"

namespace todopad::application {

/**
 * @class TaskListController
 * @brief Maintains the ordered, id-unique collection of tasks.
 *
 * Every operation is total: an unknown id is a no-op reported through the
 * return value, never an exception. Lookups are linear scans by id.
 */
class TaskListController {
public:
    /**
     * @brief Appends a new task.
     * @param text Raw input. Leading and trailing whitespace is trimmed.
     * @return The new task id, or std::nullopt if the trimmed text is empty.
     */
    std::optional<domain::TaskId> Add(const std::string& text);

    /**
     * @brief Switches the task to Editing state.
     * @return False if no task has this id.
     */
    bool BeginEdit(domain::TaskId id);

    /**
     * @brief Replaces the task text and returns it to Display state.
     * A blank @p newText is refused: the task keeps its text and stays in Editing.
     * @return True if the text was stored.
     */
    bool CommitEdit(domain::TaskId id, const std::string& newText);

    /** @brief Leaves Editing state without changing the text. */
    bool CancelEdit(domain::TaskId id);

    /** @brief Flips the completion flag. */
    bool ToggleComplete(domain::TaskId id);

    /** @brief Removes the task, keeping the order of the others. */
    bool Delete(domain::TaskId id);

    /**
     * @brief Removes every completed task.
     * @return Number of tasks removed.
     */
    std::size_t ClearCompleted();

    /** @brief Returns the task with this id, or nullptr. */
    const domain::Task* Find(domain::TaskId id) const;

    /** @brief Tasks in display order. */
    const std::vector<domain::Task>& GetTasks() const { return m_tasks; }

    domain::TaskStats GetStats() const;

    /** @brief True while at least one task is in Editing state. */
    bool IsEditingAny() const;

private:
    domain::Task* FindMutable(domain::TaskId id);

    std::vector<domain::Task> m_tasks; ///< Insertion order is display order.
    domain::TaskId m_nextId = 1;       ///< Next id to hand out; never decreases.
};

} // namespace todopad::application
