#include "core/app_config.hpp"

#include "utils/log.hpp"

namespace ticklist {
namespace {
constexpr const char* kTasksFileName = "tasks.json";
}

std::filesystem::path project_root() {
#ifdef TICKLIST_ROOT
    return std::filesystem::path(TICKLIST_ROOT);
#else
    return std::filesystem::current_path();
#endif
}

std::filesystem::path default_tasks_path() {
    return project_root() / kTasksFileName;
}

AppConfig load_app_config() {
    AppConfig config;
    config.tasks_path = default_tasks_path();
    log::debug("config: tasks file '" + config.tasks_path.string() + "'");
    return config;
}

}
