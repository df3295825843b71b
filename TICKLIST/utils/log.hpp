#pragma once

#include <ostream>
#include <string>

namespace ticklist::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Debug = 2,
};

void set_level(Level level);
Level level();

// Redirects log lines; nullptr restores stderr.
void set_stream(std::ostream* stream);

void reset_time_origin();

void error(const std::string& message);
void warn(const std::string& message);
void debug(const std::string& message);

}
