#include "cli/command_interpreter.hpp"

#include <optional>
#include <utility>

#include "cli/task_list_renderer.hpp"
#include "utils/log.hpp"

namespace ticklist::cli {
namespace {
constexpr const char* kInvalidNumber = "Invalid task number.\n";
constexpr const char* kUnknownCommand = "Unknown command. Type \"?\" for help.\n";

constexpr const char* kAddUsage = "Usage: a <task description>\n";
constexpr const char* kToggleUsage = "Usage: x <task number>\n";
constexpr const char* kRemoveUsage = "Usage: d <task number>\n";
constexpr const char* kMoveUpUsage = "Usage: h <task number>\n";
constexpr const char* kMoveDownUsage = "Usage: l <task number>\n";
constexpr const char* kRenameUsage = "Usage: r <task number> <new task description>\n";

CommandResult failure(std::string output) {
    CommandResult result;
    result.output = std::move(output);
    result.success = false;
    return result;
}

const char* status_message(StoreStatus status) {
    switch (status) {
        case StoreStatus::Ok:             return "";
        case StoreStatus::InvalidIndex:   return kInvalidNumber;
        case StoreStatus::CannotMoveUp:   return "Cannot move task up.\n";
        case StoreStatus::CannotMoveDown: return "Cannot move task down.\n";
    }
    return "";
}
}

CommandInterpreter::CommandInterpreter(TaskStore& store) : store_(store) {}

std::string CommandInterpreter::render_listing() const {
    return render_task_list(store_.tasks());
}

CommandResult CommandInterpreter::execute_line(std::string_view line) {
    const std::optional<Command> command = parse_line(line);
    if (!command) {
        return CommandResult{};
    }
    return execute(*command);
}

template <typename Op>
CommandResult CommandInterpreter::with_task_index(const Command& command, const char* usage, Op op) {
    if (!command.argument) {
        return failure(usage);
    }
    const std::optional<int> index = parse_task_index(*command.argument);
    if (!index) {
        return failure(kInvalidNumber);
    }
    return finish(op(*index));
}

CommandResult CommandInterpreter::execute(const Command& command) {
    switch (command.kind) {
        case CommandKind::Add:
            return add(command);
        case CommandKind::List: {
            CommandResult result;
            result.output = render_listing();
            return result;
        }
        case CommandKind::Toggle:
            return with_task_index(command, kToggleUsage, [this](int index) { return store_.toggle(index); });
        case CommandKind::Remove:
            return with_task_index(command, kRemoveUsage, [this](int index) { return store_.remove(index); });
        case CommandKind::MoveUp:
            return with_task_index(command, kMoveUpUsage, [this](int index) { return store_.move_up(index); });
        case CommandKind::MoveDown:
            return with_task_index(command, kMoveDownUsage, [this](int index) { return store_.move_down(index); });
        case CommandKind::Rename:
            return rename(command);
        case CommandKind::Help: {
            CommandResult result;
            result.output = help_text();
            return result;
        }
        case CommandKind::Quit: {
            CommandResult result;
            result.quit = true;
            return result;
        }
        case CommandKind::Unknown:
            break;
    }
    log::debug("cli: unknown command '" + command.token + "'");
    return failure(kUnknownCommand);
}

CommandResult CommandInterpreter::add(const Command& command) {
    if (!command.argument) {
        return failure(kAddUsage);
    }
    return finish(store_.add(*command.argument));
}

CommandResult CommandInterpreter::rename(const Command& command) {
    if (!command.argument) {
        return failure(kRenameUsage);
    }
    const std::optional<RenameArguments> args = split_rename_arguments(*command.argument);
    if (!args) {
        return failure(kRenameUsage);
    }
    const std::optional<int> index = parse_task_index(args->number);
    if (!index) {
        return failure(kInvalidNumber);
    }
    const StoreResult result = store_.rename(*index, args->description);
    return finish(result, render_rename(result.previous_description, args->description));
}

CommandResult CommandInterpreter::finish(const StoreResult& result, std::string prefix) {
    if (!result) {
        return failure(status_message(result.status));
    }
    CommandResult out;
    out.mutated = true;
    out.output = std::move(prefix) + render_listing();
    return out;
}

}
