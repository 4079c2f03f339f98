#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "application/TaskListController.hpp"

using todopad::application::TaskListController;
using todopad::domain::Task;
using todopad::domain::TaskId;

namespace {

std::vector<std::string> Texts(const TaskListController& list) {
    std::vector<std::string> out;
    for (const auto& task : list.GetTasks()) {
        out.push_back(task.text);
    }
    return out;
}

void TestAddAssignsDistinctIds() {
    TaskListController list;
    const std::vector<std::string> inputs = {"a", "b", "   ", "c", "", "d", "\t\n", "e"};
    std::set<TaskId> ids;
    size_t accepted = 0;
    for (const auto& text : inputs) {
        auto id = list.Add(text);
        if (id) {
            accepted++;
            ids.insert(*id);
        }
    }
    assert(accepted == 5);
    assert(list.GetTasks().size() == 5);
    assert(ids.size() == 5);

    for (const auto& task : list.GetTasks()) {
        assert(!task.isCompleted);
        assert(!task.isEditing);
    }
    std::cout << "[PASS] Add assigns distinct ids and skips blank input." << std::endl;
}

void TestAddTrimsText() {
    TaskListController list;
    auto id = list.Add("  buy milk \n");
    assert(id);
    assert(list.Find(*id)->text == "buy milk");
    std::cout << "[PASS] Add trims surrounding whitespace." << std::endl;
}

void TestBlankAddDoesNotConsumeId() {
    TaskListController list;
    auto first = list.Add("first");
    assert(!list.Add("    "));
    auto second = list.Add("second");
    assert(first && second);
    assert(*second == *first + 1);
    std::cout << "[PASS] Rejected add does not consume an id." << std::endl;
}

void TestIdsNotReusedAfterDelete() {
    TaskListController list;
    auto a = list.Add("a");
    auto b = list.Add("b");
    assert(list.Delete(*b));
    assert(list.Delete(*a));
    auto c = list.Add("c");
    assert(*c != *a && *c != *b);
    assert(*c > *b);
    std::cout << "[PASS] Ids are never reused." << std::endl;
}

void TestOperationsOnDeletedIdAreNoOps() {
    TaskListController list;
    auto keep = list.Add("keep");
    auto gone = list.Add("gone");
    assert(list.Delete(*gone));

    assert(!list.Delete(*gone));
    assert(!list.BeginEdit(*gone));
    assert(!list.CommitEdit(*gone, "revived"));
    assert(!list.CancelEdit(*gone));
    assert(!list.ToggleComplete(*gone));
    assert(list.Find(*gone) == nullptr);

    assert(list.GetTasks().size() == 1);
    const Task* kept = list.Find(*keep);
    assert(kept && kept->text == "keep" && !kept->isCompleted && !kept->isEditing);

    // Never-allocated id.
    assert(!list.ToggleComplete(9999));
    std::cout << "[PASS] Operations on a deleted id are no-ops." << std::endl;
}

void TestToggleIsInvolution() {
    TaskListController list;
    auto id = list.Add("task");
    assert(list.ToggleComplete(*id));
    assert(list.Find(*id)->isCompleted);
    assert(list.ToggleComplete(*id));
    assert(!list.Find(*id)->isCompleted);
    std::cout << "[PASS] ToggleComplete twice restores the flag." << std::endl;
}

void TestEditCycle() {
    TaskListController list;
    auto id = list.Add("draft");
    assert(!list.IsEditingAny());

    assert(list.BeginEdit(*id));
    assert(list.Find(*id)->isEditing);
    assert(list.IsEditingAny());

    const std::string newText = "  final text with spaces ";
    assert(list.CommitEdit(*id, newText));
    const Task* task = list.Find(*id);
    assert(task->text == newText);
    assert(!task->isEditing);
    assert(!list.IsEditingAny());

    // Edit does not touch completion.
    list.ToggleComplete(*id);
    list.BeginEdit(*id);
    list.CommitEdit(*id, "again");
    assert(list.Find(*id)->isCompleted);
    std::cout << "[PASS] BeginEdit/CommitEdit cycle." << std::endl;
}

void TestBlankCommitIsRefused() {
    TaskListController list;
    auto id = list.Add("original");
    list.BeginEdit(*id);
    assert(!list.CommitEdit(*id, " \t "));
    const Task* task = list.Find(*id);
    assert(task->text == "original");
    assert(task->isEditing);

    assert(list.CancelEdit(*id));
    assert(!list.Find(*id)->isEditing);
    assert(list.Find(*id)->text == "original");
    std::cout << "[PASS] Blank commit keeps the task in Editing." << std::endl;
}

void TestDeletePreservesOrder() {
    for (size_t k = 0; k < 5; ++k) {
        TaskListController list;
        std::vector<TaskId> ids;
        for (int i = 0; i < 5; ++i) {
            ids.push_back(*list.Add("t" + std::to_string(i)));
        }
        assert(list.Delete(ids[k]));

        std::vector<std::string> expected;
        for (size_t i = 0; i < 5; ++i) {
            if (i != k) expected.push_back("t" + std::to_string(i));
        }
        assert(Texts(list) == expected);
    }
    std::cout << "[PASS] Delete preserves relative order." << std::endl;
}

void TestClearCompleted() {
    TaskListController list;
    auto a = list.Add("a");
    auto b = list.Add("b");
    auto c = list.Add("c");
    auto d = list.Add("d");
    list.ToggleComplete(*b);
    list.ToggleComplete(*d);

    auto stats = list.GetStats();
    assert(stats.total == 4 && stats.completed == 2 && stats.pending == 2);

    assert(list.ClearCompleted() == 2);
    assert((Texts(list) == std::vector<std::string>{"a", "c"}));
    assert(list.Find(*a) && list.Find(*c));
    assert(list.ClearCompleted() == 0);
    std::cout << "[PASS] ClearCompleted removes only completed tasks." << std::endl;
}

void TestEndToEndScenario() {
    TaskListController list;
    assert(list.GetTasks().empty());

    auto milk = list.Add("buy milk");
    auto report = list.Add("write report");
    assert(list.GetTasks().size() == 2);
    assert(list.GetTasks()[0].text == "buy milk" && !list.GetTasks()[0].isCompleted);
    assert(list.GetTasks()[1].text == "write report" && !list.GetTasks()[1].isCompleted);

    list.ToggleComplete(*milk);
    assert(list.GetTasks()[0].isCompleted);

    list.Delete(*report);
    assert(list.GetTasks().size() == 1);
    assert(list.GetTasks()[0].text == "buy milk");
    assert(list.GetTasks()[0].isCompleted);
    std::cout << "[PASS] End-to-end scenario." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TaskListController Test..." << std::endl;

    TestAddAssignsDistinctIds();
    TestAddTrimsText();
    TestBlankAddDoesNotConsumeId();
    TestIdsNotReusedAfterDelete();
    TestOperationsOnDeletedIdAreNoOps();
    TestToggleIsInvolution();
    TestEditCycle();
    TestBlankCommitIsRefused();
    TestDeletePreservesOrder();
    TestClearCompleted();
    TestEndToEndScenario();

    std::cout << "[PASS] TaskListController Test." << std::endl;
    return 0;
}
