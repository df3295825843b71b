#include "cli/command_parser.hpp"

#include <utility>

#include "utils/string_utils.hpp"

namespace ticklist::cli {
namespace {
constexpr std::string_view kSeparators = " \t";
}

CommandKind command_kind_for(const std::string& lowered_token) {
    if (lowered_token == "a") return CommandKind::Add;
    if (lowered_token == "t") return CommandKind::List;
    if (lowered_token == "x") return CommandKind::Toggle;
    if (lowered_token == "d") return CommandKind::Remove;
    if (lowered_token == "h") return CommandKind::MoveUp;
    if (lowered_token == "l") return CommandKind::MoveDown;
    if (lowered_token == "r") return CommandKind::Rename;
    if (lowered_token == "?") return CommandKind::Help;
    if (lowered_token == "q") return CommandKind::Quit;
    return CommandKind::Unknown;
}

std::optional<Command> parse_line(std::string_view line) {
    line = strings::strip_trailing_cr(line);
    if (line.empty()) {
        return std::nullopt;
    }

    auto [token, rest] = strings::split_once(line, kSeparators);
    Command command;
    command.token = strings::to_lower_copy(std::move(token));
    command.kind = command_kind_for(command.token);
    command.argument = std::move(rest);
    return command;
}

std::optional<int> parse_task_index(std::string_view text) {
    const std::optional<int> number = strings::parse_digits(text);
    if (!number) {
        return std::nullopt;
    }
    return *number - 1;
}

std::optional<RenameArguments> split_rename_arguments(std::string_view argument) {
    auto [number, description] = strings::split_once(argument, kSeparators);
    if (!description) {
        return std::nullopt;
    }
    return RenameArguments{std::move(number), std::move(*description)};
}

}
