#include <exception>
#include <iostream>
#include <string>

#include "cli/command_interpreter.hpp"
#include "cli/repl.hpp"
#include "core/app_config.hpp"
#include "core/task_store.hpp"
#include "utils/log.hpp"

int main() {
    ticklist::log::reset_time_origin();

    try {
        const ticklist::AppConfig config = ticklist::load_app_config();

        ticklist::TaskStore store(config.tasks_path);
        store.load();

        ticklist::cli::CommandInterpreter interpreter(store);
        ticklist::cli::Repl repl(interpreter, std::cin, std::cout, config.prompt);
        return repl.run();
    } catch (const std::exception& e) {
        ticklist::log::error(std::string("ticklist: ") + e.what());
        return 1;
    }
}
