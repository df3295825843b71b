#include "log.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

#include "utils/string_utils.hpp"

namespace ticklist::log {
namespace {

// Process-wide logger state. Built on first use, when the environment is read.
struct Logger {
    Logger();

    std::mutex mutex;
    Level threshold = Level::Warn;
    std::ostream* stream = nullptr;
    std::unique_ptr<std::ofstream> file;
    std::chrono::steady_clock::time_point origin = std::chrono::steady_clock::now();
};

Level level_from_env(const char* value, Level fallback) {
    if (!value) return fallback;
    const std::string lower = strings::to_lower_copy(value);
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "debug") return Level::Debug;
    return fallback;
}

bool env_flag_set(const char* name) {
    const char* v = std::getenv(name);
    return v && (*v == '1' || *v == 'y' || *v == 'Y' || *v == 't' || *v == 'T');
}

Logger::Logger() {
    threshold = level_from_env(std::getenv("TICKLIST_LOG_LEVEL"), threshold);

    const char* path = std::getenv("TICKLIST_LOG_FILE");
    if (path && *path) {
        const auto mode = std::ios::out | (env_flag_set("TICKLIST_LOG_APPEND") ? std::ios::app : std::ios::trunc);
        auto sink = std::make_unique<std::ofstream>(path, mode);
        if (sink->good()) {
            file = std::move(sink);
        }
    }
}

Logger& logger() {
    static Logger instance;
    return instance;
}

const char* level_tag(Level level) {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Debug: return "DEBUG";
    }
    return "WARN";
}

void write(Level level, const std::string& message) {
    Logger& log = logger();
    std::lock_guard<std::mutex> lock(log.mutex);
    if (static_cast<int>(level) > static_cast<int>(log.threshold)) {
        return;
    }

    using namespace std::chrono;
    const double secs = duration_cast<duration<double>>(steady_clock::now() - log.origin).count();
    std::ostringstream line;
    line.setf(std::ios::fixed);
    line << '[' << level_tag(level) << "] +" << std::setprecision(3) << secs << "s: " << message << '\n';

    // stdout belongs to the prompt and task listing
    std::ostream& os = log.stream ? *log.stream : std::cerr;
    os << line.str() << std::flush;
    if (log.file) {
        *log.file << line.str() << std::flush;
    }
}

}

void set_level(Level level) {
    Logger& log = logger();
    std::lock_guard<std::mutex> lock(log.mutex);
    log.threshold = level;
}

Level level() {
    Logger& log = logger();
    std::lock_guard<std::mutex> lock(log.mutex);
    return log.threshold;
}

void set_stream(std::ostream* stream) {
    Logger& log = logger();
    std::lock_guard<std::mutex> lock(log.mutex);
    log.stream = stream;
}

void reset_time_origin() {
    Logger& log = logger();
    std::lock_guard<std::mutex> lock(log.mutex);
    log.origin = std::chrono::steady_clock::now();
}

void error(const std::string& message) { write(Level::Error, message); }
void warn(const std::string& message)  { write(Level::Warn, message); }
void debug(const std::string& message) { write(Level::Debug, message); }

}
