#pragma once

#include <string>
#include <string_view>

#include "cli/command_parser.hpp"
#include "core/task_store.hpp"

namespace ticklist::cli {

struct CommandResult {
    std::string output;
    bool success = true;
    bool mutated = false;
    bool quit = false;
};

// Maps one parsed command onto a TaskStore operation.
//
// The returned output is everything the user should see for the command;
// nothing is printed here. Argument errors are reported before the store is
// touched, so a rejected command never changes the list or the file.
class CommandInterpreter {
public:
    explicit CommandInterpreter(TaskStore& store);

    CommandResult execute(const Command& command);
    CommandResult execute_line(std::string_view line);

    std::string render_listing() const;

private:
    CommandResult add(const Command& command);
    CommandResult rename(const Command& command);

    template <typename Op>
    CommandResult with_task_index(const Command& command, const char* usage, Op op);

    CommandResult finish(const StoreResult& result, std::string prefix = {});

    TaskStore& store_;
};

}
