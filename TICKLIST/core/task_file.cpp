#include "core/task_file.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "utils/log.hpp"

namespace ticklist::task_file {
namespace {
constexpr int kIndent = 2;

void ensure_directory_exists(const std::filesystem::path& dir) {
    if (dir.empty()) {
        return;
    }

    std::error_code ec;
    if (std::filesystem::create_directories(dir, ec)) {
        return;
    }

    if (ec && !std::filesystem::exists(dir)) {
        std::ostringstream oss;
        oss << "Failed to create task file directory '" << dir.u8string() << "': " << ec.message();
        throw std::runtime_error(oss.str());
    }
}

std::filesystem::path temp_path_for(const std::filesystem::path& path) {
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    return tmp;
}

void write_document(const std::filesystem::path& path, const nlohmann::json& document) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        std::ostringstream oss;
        oss << "Unable to open task file at '" << path.string() << "' for writing.";
        throw std::runtime_error(oss.str());
    }
    // Bytes that are not valid UTF-8 become U+FFFD instead of failing the save.
    out << document.dump(kIndent, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    out.flush();
    if (!out.good()) {
        std::ostringstream oss;
        oss << "Failed while writing task file at '" << path.string() << "'.";
        throw std::runtime_error(oss.str());
    }
}

}

const char* to_string(LoadStatus status) {
    switch (status) {
        case LoadStatus::Loaded:     return "loaded";
        case LoadStatus::Missing:    return "missing";
        case LoadStatus::ReadError:  return "read error";
        case LoadStatus::ParseError: return "parse error";
    }
    return "unknown";
}

nlohmann::json make_document(const std::vector<Task>& tasks) {
    nlohmann::json document = nlohmann::json::array();
    for (const auto& task : tasks) {
        document.push_back(task_to_json(task));
    }
    return document;
}

bool parse_document(const nlohmann::json& document,
                    std::vector<Task>& out,
                    std::string* error) {
    out.clear();
    if (document.is_null()) {
        return true;
    }
    if (!document.is_array()) {
        if (error) *error = std::string("expected a JSON array of tasks, found ") + document.type_name();
        return false;
    }

    std::vector<Task> parsed;
    parsed.reserve(document.size());
    for (std::size_t i = 0; i < document.size(); ++i) {
        Task task;
        std::string reason;
        if (!task_from_json(document[i], task, &reason)) {
            if (error) *error = "entry " + std::to_string(i) + ": " + reason;
            return false;
        }
        parsed.push_back(std::move(task));
    }
    out = std::move(parsed);
    return true;
}

LoadResult load_tasks(const std::filesystem::path& path) {
    LoadResult result;

    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        result.status = LoadStatus::ReadError;
        result.error = ec.message();
        return result;
    }
    if (!exists) {
        result.status = LoadStatus::Missing;
        return result;
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        result.status = LoadStatus::ReadError;
        result.error = "'" + path.string() + "' is not a regular file";
        return result;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        result.status = LoadStatus::ReadError;
        result.error = "unable to open '" + path.string() + "'";
        return result;
    }

    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error& e) {
        result.status = LoadStatus::ParseError;
        result.error = e.what();
        return result;
    }

    if (!parse_document(document, result.tasks, &result.error)) {
        result.status = LoadStatus::ParseError;
        return result;
    }

    result.status = LoadStatus::Loaded;
    log::debug("task_file: loaded " + std::to_string(result.tasks.size()) +
                         " task(s) from '" + path.string() + "'");
    return result;
}

void save_tasks(const std::filesystem::path& path, const std::vector<Task>& tasks) {
    ensure_directory_exists(path.parent_path());

    const std::filesystem::path tmp = temp_path_for(path);
    std::error_code ec;
    try {
        write_document(tmp, make_document(tasks));
    } catch (const std::exception&) {
        std::filesystem::remove(tmp, ec);
        throw;
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::filesystem::remove(tmp, ec);
        std::ostringstream oss;
        oss << "Unable to replace task file at '" << path.string() << "': " << reason;
        throw std::runtime_error(oss.str());
    }
}

}
