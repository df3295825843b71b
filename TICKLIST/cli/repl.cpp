#include "cli/repl.hpp"

#include <optional>
#include <string>
#include <utility>

#include "utils/log.hpp"

namespace ticklist::cli {

Repl::Repl(CommandInterpreter& interpreter, std::istream& in, std::ostream& out, std::string prompt)
    : interpreter_(interpreter), in_(in), out_(out), prompt_(std::move(prompt)) {}

int Repl::run() {
    out_ << interpreter_.render_listing();
    out_.flush();
    while (!terminated_) {
        if (!step()) {
            terminated_ = true;
        }
    }
    log::debug("cli: loop finished after " + std::to_string(commands_processed_) + " command(s)");
    return 0;
}

bool Repl::step() {
    out_ << prompt_;
    out_.flush();

    std::string line;
    if (!std::getline(in_, line)) {
        return false;
    }

    const std::optional<Command> command = parse_line(line);
    if (!command) {
        return true;
    }
    ++commands_processed_;

    const CommandResult result = interpreter_.execute(*command);
    out_ << result.output;
    out_.flush();
    return !result.quit;
}

}
