#pragma once

#include <string>

#include "core/task_list.hpp"

namespace ticklist::cli {

std::string checkbox_marker(const Task& task);

// "No tasks." for an empty list, otherwise a blank line, one
// "N. [ ] description" row per task and a closing blank line.
std::string render_task_list(const TaskList& tasks);

std::string render_rename(const std::string& from, const std::string& to);

std::string help_text();

}
