#pragma once

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace ticklist {

struct Task {
    std::string description;
    bool completed = false;
};

inline bool operator==(const Task& a, const Task& b) {
    return a.description == b.description && a.completed == b.completed;
}

inline bool operator!=(const Task& a, const Task& b) {
    return !(a == b);
}

nlohmann::json task_to_json(const Task& task);

// Missing fields keep their defaults; a non-object or a field of the wrong
// type is rejected with a reason in error.
bool task_from_json(const nlohmann::json& entry, Task& out, std::string* error = nullptr);

}
