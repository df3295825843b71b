#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/task.hpp"

namespace ticklist {

// Ordered task sequence with bounds-checked, in-memory mutations.
//
// Indices are 0-based and signed so that a user-supplied "0" (index -1)
// arrives here and is rejected like any other out-of-range value. Every
// mutation returns false and leaves the list untouched when it cannot apply.
class TaskList {
public:
    TaskList() = default;
    explicit TaskList(std::vector<Task> tasks);

    void add(std::string description);
    bool toggle(int index);
    bool remove(int index);
    bool move_up(int index);
    bool move_down(int index);
    bool rename(int index, std::string description, std::string* previous = nullptr);

    bool contains_index(int index) const;

    std::size_t size() const { return tasks_.size(); }
    bool empty() const { return tasks_.empty(); }
    const Task& at(std::size_t index) const { return tasks_.at(index); }
    const std::vector<Task>& items() const { return tasks_; }

    void clear() { tasks_.clear(); }
    void assign(std::vector<Task> tasks) { tasks_ = std::move(tasks); }

private:
    std::vector<Task> tasks_;
};

}
