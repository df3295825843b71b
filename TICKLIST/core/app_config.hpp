#pragma once

#include <filesystem>
#include <string>

namespace ticklist {

struct AppConfig {
    std::filesystem::path tasks_path;
    std::string prompt = "> ";
};

std::filesystem::path project_root();

// tasks.json under project_root().
std::filesystem::path default_tasks_path();

AppConfig load_app_config();

}
