#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ticklist::cli {

enum class CommandKind {
    Add,
    List,
    Toggle,
    Remove,
    MoveUp,
    MoveDown,
    Rename,
    Help,
    Quit,
    Unknown,
};

struct Command {
    CommandKind kind = CommandKind::Unknown;
    std::string token;
    // Everything after the first separator, verbatim. std::nullopt when the
    // line had no separator; "a " carries an empty argument instead.
    std::optional<std::string> argument;
};

struct RenameArguments {
    std::string number;
    std::string description;
};

CommandKind command_kind_for(const std::string& lowered_token);

// std::nullopt for an empty line.
std::optional<Command> parse_line(std::string_view line);

// 1-based task number to 0-based index. std::nullopt unless the text is
// a plain run of digits.
std::optional<int> parse_task_index(std::string_view text);

// Splits "<n> <description>"; std::nullopt when there is no separator.
// "1 " yields an empty description.
std::optional<RenameArguments> split_rename_arguments(std::string_view argument);

}
