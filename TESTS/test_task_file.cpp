#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/task_file.hpp"
#include "test_paths.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;
using ticklist::Task;
namespace task_file = ticklist::task_file;

namespace {
void write_text(const fs::path& path, const std::string& text) {
    std::ofstream out(path);
    REQUIRE(out.is_open());
    out << text;
}
}

TEST_CASE("task file load reports a missing file without error") {
    const fs::path dir = ticklist_test::fresh_dir("task_file_missing");
    const auto result = task_file::load_tasks(dir / "tasks.json");
    CHECK(result.status == task_file::LoadStatus::Missing);
    CHECK(result.tasks.empty());
    CHECK(result.error.empty());
}

TEST_CASE("task file save then load reproduces the same ordered list") {
    const fs::path dir = ticklist_test::fresh_dir("task_file_round_trip");
    const fs::path path = dir / "tasks.json";
    const std::vector<Task> tasks{{"buy milk", false}, {"call \"mom\"", true}, {"ünïcode ✓", false}};

    task_file::save_tasks(path, tasks);
    CHECK_FALSE(fs::exists(dir / "tasks.json.tmp"));

    const auto result = task_file::load_tasks(path);
    REQUIRE(result.status == task_file::LoadStatus::Loaded);
    CHECK(result.tasks == tasks);
}

TEST_CASE("task file is an array of description/isCompleted records") {
    const fs::path dir = ticklist_test::fresh_dir("task_file_format");
    const fs::path path = dir / "tasks.json";
    task_file::save_tasks(path, {{"write report", true}});

    nlohmann::json written;
    {
        std::ifstream in(path);
        REQUIRE(in.is_open());
        in >> written;
    }
    REQUIRE(written.is_array());
    REQUIRE(written.size() == 1);
    CHECK(written[0]["description"] == "write report");
    CHECK(written[0]["isCompleted"] == true);
}

TEST_CASE("task file accepts missing fields, unknown fields and null") {
    const fs::path dir = ticklist_test::fresh_dir("task_file_lenient");
    const fs::path path = dir / "tasks.json";

    write_text(path, R"([{"description": "only text"}, {"isCompleted": true, "extra": 3}])");
    auto result = task_file::load_tasks(path);
    REQUIRE(result.status == task_file::LoadStatus::Loaded);
    REQUIRE(result.tasks.size() == 2);
    CHECK(result.tasks[0] == Task{"only text", false});
    CHECK(result.tasks[1] == Task{"", true});

    write_text(path, "null");
    result = task_file::load_tasks(path);
    CHECK(result.status == task_file::LoadStatus::Loaded);
    CHECK(result.tasks.empty());
}

TEST_CASE("task file rejects corrupt or wrongly shaped content") {
    ticklist::log::set_level(ticklist::log::Level::Error);
    const fs::path dir = ticklist_test::fresh_dir("task_file_corrupt");
    const fs::path path = dir / "tasks.json";

    const std::vector<std::string> bad{
        "[{\"description\": \"half",
        "",
        R"({"description": "not a list"})",
        R"(["just a string"])",
        R"([{"description": 42}])",
        R"([{"description": "ok", "isCompleted": "yes"}])",
    };
    for (const auto& text : bad) {
        CAPTURE(text);
        write_text(path, text);
        const auto result = task_file::load_tasks(path);
        CHECK(result.status == task_file::LoadStatus::ParseError);
        CHECK(result.tasks.empty());
        CHECK_FALSE(result.error.empty());
    }
}

TEST_CASE("task file save throws when the target cannot be created") {
    const fs::path dir = ticklist_test::fresh_dir("task_file_unwritable");
    const fs::path blocker = dir / "blocker";
    write_text(blocker, "a regular file, not a directory");

    const std::vector<Task> tasks{{"x", false}};
    CHECK_THROWS_AS(task_file::save_tasks(blocker / "tasks.json", tasks), std::runtime_error);
}

TEST_CASE("task file save overwrites previous content entirely") {
    const fs::path dir = ticklist_test::fresh_dir("task_file_overwrite");
    const fs::path path = dir / "tasks.json";

    task_file::save_tasks(path, {{"a", false}, {"b", false}, {"c", true}});
    task_file::save_tasks(path, {{"z", true}});

    const auto result = task_file::load_tasks(path);
    REQUIRE(result.status == task_file::LoadStatus::Loaded);
    CHECK(result.tasks == std::vector<Task>{{"z", true}});
}
