/**
 * @file AppState.hpp
 * @brief Core application state and UI action coordination.
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>

#include "application/TaskListController.hpp"
#include "domain/Task.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace todopad::ui {

    /**
     * @struct UiState
     * @brief State for UI flags, input buffers and the activity log.
     */
    struct UiState {
        std::string outputLog;
        std::size_t outputLogLines = 0;                ///< Newline count of outputLog.
        std::string newTaskInput;                      ///< Content of the "Add Task" field.
        std::map<domain::TaskId, std::string> drafts;  ///< Edit buffers of rows in Editing state.
        bool showCompleted = true;
        bool showLog = false;
        bool emojiEnabled = false;
        bool requestExit = false;
    };

/**
 * @struct AppState
 * @brief Everything the renderer needs for one frame. Owned by the app and
 * passed by reference to DrawUI.
 *
 * The action methods are what the widgets call; they keep the edit drafts in
 * step with the controller and write the activity log.
 */
struct AppState {
    application::TaskListController tasks;
    infrastructure::AppConfig config;
    UiState ui;

    /**
     * @brief Adds the content of the input field as a new task.
     * The input is cleared on success and kept when the text is blank.
     * @return True if a task was added.
     */
    bool SubmitNewTask();

    /** @brief Enters Editing state and seeds the draft from the task text. */
    void BeginEdit(domain::TaskId id);
    /** @brief Pushes the draft to the controller; blank drafts stay open. */
    bool CommitEdit(domain::TaskId id);
    /** @brief Drops the draft and leaves Editing state. */
    void CancelEdit(domain::TaskId id);
    /** @brief Commits every open draft. Returns the number committed. */
    std::size_t CommitAllEdits();
    /** @brief Cancels every open draft. */
    void CancelAllEdits();

    void ToggleComplete(domain::TaskId id);
    void DeleteTask(domain::TaskId id);
    void ClearCompleted();

    /** @brief Returns the edit buffer for a task, creating it if needed. */
    std::string& DraftFor(domain::TaskId id);

    /**
     * @brief Appends a line to the activity log and echoes it to stdout.
     * Only the newest kMaxLogLines lines are kept.
     */
    void AppendLog(const std::string& line);

    /**
     * @brief Button rows kept free below the task list: the status bar, plus
     * the edit-actions row whenever a row could enter Editing this frame.
     */
    int FooterRows() const;

    static constexpr std::size_t kMaxLogLines = 500;
};

} // namespace todopad::ui
