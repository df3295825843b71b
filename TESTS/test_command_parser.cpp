#include "doctest/doctest.h"

#include <optional>
#include <string>

#include "cli/command_parser.hpp"

using namespace ticklist::cli;

TEST_CASE("parse_line ignores empty lines") {
    CHECK_FALSE(parse_line("").has_value());
    CHECK_FALSE(parse_line("\r").has_value());
}

TEST_CASE("parse_line lower-cases the command token and keeps the remainder verbatim") {
    const auto command = parse_line("A  Buy milk and  eggs \r");
    REQUIRE(command.has_value());
    CHECK(command->kind == CommandKind::Add);
    CHECK(command->token == "a");
    CHECK(command->argument == " Buy milk and  eggs ");
}

TEST_CASE("parse_line splits once at the first space or tab") {
    auto command = parse_line("r\t2 new name here");
    REQUIRE(command.has_value());
    CHECK(command->kind == CommandKind::Rename);
    CHECK(command->argument == "2 new name here");

    command = parse_line("t");
    REQUIRE(command.has_value());
    CHECK(command->kind == CommandKind::List);
    CHECK_FALSE(command->argument.has_value());

    command = parse_line("a ");
    REQUIRE(command.has_value());
    REQUIRE(command->argument.has_value());
    CHECK(command->argument->empty());
}

TEST_CASE("command tokens map to their commands") {
    CHECK(command_kind_for("a") == CommandKind::Add);
    CHECK(command_kind_for("t") == CommandKind::List);
    CHECK(command_kind_for("x") == CommandKind::Toggle);
    CHECK(command_kind_for("d") == CommandKind::Remove);
    CHECK(command_kind_for("h") == CommandKind::MoveUp);
    CHECK(command_kind_for("l") == CommandKind::MoveDown);
    CHECK(command_kind_for("r") == CommandKind::Rename);
    CHECK(command_kind_for("?") == CommandKind::Help);
    CHECK(command_kind_for("q") == CommandKind::Quit);
    CHECK(command_kind_for("add") == CommandKind::Unknown);
    CHECK(command_kind_for("") == CommandKind::Unknown);
}

TEST_CASE("a line starting with whitespace has an empty, unknown token") {
    const auto command = parse_line(" x 1");
    REQUIRE(command.has_value());
    CHECK(command->kind == CommandKind::Unknown);
    CHECK(command->token.empty());
}

TEST_CASE("parse_task_index converts 1-based digit runs to 0-based indices") {
    CHECK(parse_task_index("1") == std::optional<int>(0));
    CHECK(parse_task_index("42") == std::optional<int>(41));
    CHECK(parse_task_index("0") == std::optional<int>(-1));
    CHECK(parse_task_index("007") == std::optional<int>(6));

    CHECK_FALSE(parse_task_index("").has_value());
    CHECK_FALSE(parse_task_index("abc").has_value());
    CHECK_FALSE(parse_task_index("-1").has_value());
    CHECK_FALSE(parse_task_index("+1").has_value());
    CHECK_FALSE(parse_task_index("1 2").has_value());
    CHECK_FALSE(parse_task_index("99999999999").has_value());
}

TEST_CASE("split_rename_arguments needs a number and a description") {
    auto args = split_rename_arguments("3 buy oat milk");
    REQUIRE(args.has_value());
    CHECK(args->number == "3");
    CHECK(args->description == "buy oat milk");

    CHECK_FALSE(split_rename_arguments("").has_value());
    CHECK_FALSE(split_rename_arguments("3").has_value());

    args = split_rename_arguments("3 ");
    REQUIRE(args.has_value());
    CHECK(args->number == "3");
    CHECK(args->description.empty());

    args = split_rename_arguments("abc def");
    REQUIRE(args.has_value());
    CHECK(args->number == "abc");
}
