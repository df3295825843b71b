#pragma once

#include <istream>
#include <cstddef>
#include <ostream>
#include <string>

#include "cli/command_interpreter.hpp"

namespace ticklist::cli {

// Line-oriented prompt loop. Runs until a quit command or end of input.
class Repl {
public:
    Repl(CommandInterpreter& interpreter, std::istream& in, std::ostream& out, std::string prompt = "> ");

    int run();

    bool terminated() const { return terminated_; }
    std::size_t commands_processed() const { return commands_processed_; }

private:
    bool step();

    CommandInterpreter& interpreter_;
    std::istream& in_;
    std::ostream& out_;
    std::string prompt_;
    bool terminated_ = false;
    std::size_t commands_processed_ = 0;
};

}
