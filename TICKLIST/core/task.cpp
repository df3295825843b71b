#include "core/task.hpp"

#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace ticklist {
namespace {
constexpr const char* kDescriptionKey = "description";
constexpr const char* kCompletedKey = "isCompleted";

bool fail(std::string* error, std::string message) {
    if (error) *error = std::move(message);
    return false;
}
}

nlohmann::json task_to_json(const Task& task) {
    nlohmann::json entry = nlohmann::json::object();
    entry[kDescriptionKey] = task.description;
    entry[kCompletedKey] = task.completed;
    return entry;
}

bool task_from_json(const nlohmann::json& entry, Task& out, std::string* error) {
    if (!entry.is_object()) {
        return fail(error, std::string("expected a task object, found ") + entry.type_name());
    }

    Task task;
    auto description = entry.find(kDescriptionKey);
    if (description != entry.end() && !description->is_null()) {
        if (!description->is_string()) {
            return fail(error, std::string("'description' must be a string, found ") + description->type_name());
        }
        task.description = description->get<std::string>();
    }

    auto completed = entry.find(kCompletedKey);
    if (completed != entry.end() && !completed->is_null()) {
        if (!completed->is_boolean()) {
            return fail(error, std::string("'isCompleted' must be a boolean, found ") + completed->type_name());
        }
        task.completed = completed->get<bool>();
    }

    out = std::move(task);
    return true;
}

}
