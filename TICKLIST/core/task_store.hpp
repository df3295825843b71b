#pragma once

#include <filesystem>
#include <string>

#include "core/task_file.hpp"
#include "core/task_list.hpp"

namespace ticklist {

enum class StoreStatus {
    Ok,
    InvalidIndex,
    CannotMoveUp,
    CannotMoveDown,
};

struct StoreResult {
    StoreStatus status = StoreStatus::Ok;
    // False when the mutation applied but the backing file write failed.
    bool saved = false;
    // Set by rename.
    std::string previous_description;

    bool ok() const { return status == StoreStatus::Ok; }
    explicit operator bool() const { return ok(); }
};

// Owns the task list together with its backing file.
//
// Each successful mutation rewrites the whole file. A failed write is logged
// and leaves the in-memory list as mutated, so memory and disk may differ
// until the next successful save. Failed mutations never touch the file.
class TaskStore {
public:
    explicit TaskStore(std::filesystem::path path);

    // Reads the backing file once. Absent, unreadable or unparseable files
    // all leave the list empty; only the latter two are logged as errors.
    task_file::LoadStatus load();
    bool save();

    StoreResult add(std::string description);
    StoreResult toggle(int index);
    StoreResult remove(int index);
    StoreResult move_up(int index);
    StoreResult move_down(int index);
    StoreResult rename(int index, std::string description);

    const TaskList& tasks() const { return tasks_; }
    const std::filesystem::path& path() const { return path_; }
    bool loaded() const { return loaded_; }

private:
    StoreResult commit(StoreResult result);

    std::filesystem::path path_;
    TaskList tasks_;
    bool loaded_ = false;
    task_file::LoadStatus load_status_ = task_file::LoadStatus::Missing;
};

}
