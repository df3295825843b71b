#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/task.hpp"

namespace ticklist::task_file {

enum class LoadStatus {
    Loaded,
    Missing,
    ReadError,
    ParseError,
};

struct LoadResult {
    LoadStatus status = LoadStatus::Missing;
    std::vector<Task> tasks;
    std::string error;
};

const char* to_string(LoadStatus status);

nlohmann::json make_document(const std::vector<Task>& tasks);

// A null document is an empty list. Anything else that is not an array of
// task objects fails and leaves out empty.
bool parse_document(const nlohmann::json& document,
                    std::vector<Task>& out,
                    std::string* error = nullptr);

LoadResult load_tasks(const std::filesystem::path& path);

// Writes through "<path>.tmp" and renames over path. Throws
// std::runtime_error when the file cannot be written or replaced.
void save_tasks(const std::filesystem::path& path, const std::vector<Task>& tasks);

}
