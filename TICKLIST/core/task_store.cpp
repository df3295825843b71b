#include "core/task_store.hpp"

#include <stdexcept>
#include <utility>

#include "utils/log.hpp"

namespace ticklist {

TaskStore::TaskStore(std::filesystem::path path) : path_(std::move(path)) {}

task_file::LoadStatus TaskStore::load() {
    if (loaded_) {
        log::warn("store: '" + path_.string() + "' already loaded; ignoring reload");
        return load_status_;
    }
    loaded_ = true;

    task_file::LoadResult result = task_file::load_tasks(path_);
    load_status_ = result.status;
    switch (result.status) {
        case task_file::LoadStatus::Loaded:
            tasks_.assign(std::move(result.tasks));
            break;
        case task_file::LoadStatus::Missing:
            tasks_.clear();
            log::debug("store: no task file at '" + path_.string() + "'; starting empty");
            break;
        case task_file::LoadStatus::ReadError:
            tasks_.clear();
            log::error("Error reading file '" + path_.string() + "': " + result.error);
            break;
        case task_file::LoadStatus::ParseError:
            tasks_.clear();
            log::error("Error parsing JSON in '" + path_.string() + "': " + result.error);
            break;
    }
    return load_status_;
}

bool TaskStore::save() {
    try {
        task_file::save_tasks(path_, tasks_.items());
    } catch (const std::exception& e) {
        log::error(std::string("Error writing file: ") + e.what());
        return false;
    }
    log::debug("store: saved " + std::to_string(tasks_.size()) + " task(s)");
    return true;
}

StoreResult TaskStore::commit(StoreResult result) {
    if (result.ok()) {
        result.saved = save();
    }
    return result;
}

StoreResult TaskStore::add(std::string description) {
    tasks_.add(std::move(description));
    return commit(StoreResult{});
}

StoreResult TaskStore::toggle(int index) {
    StoreResult result;
    if (!tasks_.toggle(index)) result.status = StoreStatus::InvalidIndex;
    return commit(std::move(result));
}

StoreResult TaskStore::remove(int index) {
    StoreResult result;
    if (!tasks_.remove(index)) result.status = StoreStatus::InvalidIndex;
    return commit(std::move(result));
}

StoreResult TaskStore::move_up(int index) {
    StoreResult result;
    if (!tasks_.move_up(index)) result.status = StoreStatus::CannotMoveUp;
    return commit(std::move(result));
}

StoreResult TaskStore::move_down(int index) {
    StoreResult result;
    if (!tasks_.move_down(index)) result.status = StoreStatus::CannotMoveDown;
    return commit(std::move(result));
}

StoreResult TaskStore::rename(int index, std::string description) {
    StoreResult result;
    if (!tasks_.rename(index, std::move(description), &result.previous_description)) {
        result.status = StoreStatus::InvalidIndex;
    }
    return commit(std::move(result));
}

}
