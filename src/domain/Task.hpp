/**
 * @file Task.hpp
 * @brief Domain entity representing a single to-do item.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace todopad::domain {

/** @brief Stable task identifier. Never reused within a list's lifetime. */
using TaskId = std::uint64_t;

/**
 * @struct Task
 * @brief A to-do item with its text, completion flag and transient edit flag.
 */
struct Task {
    TaskId id = 0;            ///< Identifier assigned by the controller.
    std::string text;         ///< Task text, never blank once stored.
    bool isCompleted = false; ///< True if the task is finished.
    bool isEditing = false;   ///< True while the row shows an editable field.

    Task() = default;

    /**
     * @brief Constructor for Task.
     * @param taskId Identifier allocated by the owning list.
     * @param content Task text.
     */
    Task(TaskId taskId, const std::string& content)
        : id(taskId), text(content) {}
};

/**
 * @struct TaskStats
 * @brief Counters shown in the status bar.
 */
struct TaskStats {
    std::size_t total = 0;
    std::size_t completed = 0;
    std::size_t pending = 0;
    std::size_t editing = 0;
};

} // namespace todopad::domain
