#include "core/task_list.hpp"

#include <utility>

namespace ticklist {

TaskList::TaskList(std::vector<Task> tasks) : tasks_(std::move(tasks)) {}

bool TaskList::contains_index(int index) const {
    return index >= 0 && static_cast<std::size_t>(index) < tasks_.size();
}

void TaskList::add(std::string description) {
    tasks_.push_back(Task{std::move(description), false});
}

bool TaskList::toggle(int index) {
    if (!contains_index(index)) return false;
    Task& task = tasks_[static_cast<std::size_t>(index)];
    task.completed = !task.completed;
    return true;
}

bool TaskList::remove(int index) {
    if (!contains_index(index)) return false;
    tasks_.erase(tasks_.begin() + index);
    return true;
}

bool TaskList::move_up(int index) {
    if (index < 1 || !contains_index(index)) return false;
    std::swap(tasks_[static_cast<std::size_t>(index)], tasks_[static_cast<std::size_t>(index - 1)]);
    return true;
}

bool TaskList::move_down(int index) {
    if (!contains_index(index) || !contains_index(index + 1)) return false;
    std::swap(tasks_[static_cast<std::size_t>(index)], tasks_[static_cast<std::size_t>(index + 1)]);
    return true;
}

bool TaskList::rename(int index, std::string description, std::string* previous) {
    if (!contains_index(index)) return false;
    Task& task = tasks_[static_cast<std::size_t>(index)];
    if (previous) *previous = task.description;
    task.description = std::move(description);
    return true;
}

}
