#include "cli/task_list_renderer.hpp"

#include <sstream>

namespace ticklist::cli {

std::string checkbox_marker(const Task& task) {
    return task.completed ? "[X]" : "[ ]";
}

std::string render_task_list(const TaskList& tasks) {
    if (tasks.empty()) {
        return "No tasks.\n";
    }
    std::ostringstream out;
    out << '\n';
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        const Task& task = tasks.at(i);
        out << (i + 1) << ". " << checkbox_marker(task) << ' ' << task.description << '\n';
    }
    out << '\n';
    return out.str();
}

std::string render_rename(const std::string& from, const std::string& to) {
    return "  From: " + from + "\n  To:   " + to + "\n";
}

std::string help_text() {
    return "Available commands:\n"
           "  a <task description> - Add a new task\n"
           "  t - List all tasks\n"
           "  x <task number> - Mark task as complete/incomplete\n"
           "  d <task number> - Remove task\n"
           "  h <task number> - Move task higher\n"
           "  l <task number> - Move task lower\n"
           "  r <task number> <new description> - Rename task\n"
           "  ? - Show this help message\n"
           "  q - Quit the application\n";
}

}
