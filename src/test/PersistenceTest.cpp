#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "persistence.hpp"

namespace {

bool is_error(const Persistence::LoadResult& result, Persistence::Error::Kind kind) {
    auto* error = std::get_if<Persistence::Error>(&result);
    return error && error->kind == kind;
}

const TaskList& tasks_of(const Persistence::LoadResult& result) {
    assert(std::holds_alternative<TaskList>(result));
    return std::get<TaskList>(result);
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
}

void testRoundTrip() {
    TaskList tasks = TaskList{}
                         .push_back(Task{4, "Write report", false})
                         .push_back(Task{1, "Caf\xc3\xa9 \"quoted\"\nsecond line", true})
                         .push_back(Task{9, "", false});
    auto decoded = Persistence::deserialize(Persistence::serialize(tasks));
    assert(tasks_of(decoded) == tasks);

    assert(tasks_of(Persistence::deserialize(Persistence::serialize(TaskList{}))).empty());
}

void testEncodingIsFieldTagged() {
    auto j = nlohmann::json::parse(Persistence::serialize(TaskList{}.push_back(Task{2, "B", true})));
    assert(j.at("version") == 1);
    assert(j.at("tasks").size() == 1);
    assert(j.at("tasks")[0].at("id") == 2);
    assert(j.at("tasks")[0].at("description") == "B");
    assert(j.at("tasks")[0].at("completed") == true);
    // Same input, same bytes
    assert(Persistence::serialize(TaskList{}.push_back(Task{2, "B", true})) ==
           Persistence::serialize(TaskList{}.push_back(Task{2, "B", true})));
}

void testUnknownFieldsIgnored() {
    auto decoded = Persistence::deserialize(R"({
        "version": 2,
        "theme": "dark",
        "tasks": [{"id": 5, "description": "Plan", "completed": false, "priority": "high"}]
    })");
    assert((tasks_of(decoded) == TaskList{}.push_back(Task{5, "Plan", false})));
}

void testBareArrayFromFirstRelease() {
    auto decoded = Persistence::deserialize(R"([
        {"id": 1, "description": "A", "completed": false, "edit": false},
        {"id": 2, "description": "B", "completed": true, "edit": true}
    ])");
    const auto& tasks = tasks_of(decoded);
    assert(tasks.size() == 2);
    assert((tasks[1] == Task{2, "B", true}));
}

void testMalformedInputRejected() {
    using Kind = Persistence::Error::Kind;
    const char* cases[] = {
        "",
        "not json at all",
        "{\"tasks\": [",
        "42",
        "\"tasks\"",
        "{}",
        "{\"tasks\": {}}",
        "{\"tasks\": [1, 2]}",
        "{\"tasks\": [{\"description\": \"no id\", \"completed\": false}]}",
        "{\"tasks\": [{\"id\": 1, \"completed\": false}]}",
        "{\"tasks\": [{\"id\": 1, \"description\": \"no flag\"}]}",
        "{\"tasks\": [{\"id\": \"1\", \"description\": \"A\", \"completed\": false}]}",
        "{\"tasks\": [{\"id\": -1, \"description\": \"A\", \"completed\": false}]}",
        "{\"tasks\": [{\"id\": 1.5, \"description\": \"A\", \"completed\": false}]}",
        "[{\"id\": 1, \"description\": \"A\", \"completed\": false},"
        " {\"id\": 18446744073709551615, \"description\": \"B\", \"completed\": false}]",
        "{\"tasks\": [{\"id\": 1, \"description\": 7, \"completed\": false}]}",
        "{\"tasks\": [{\"id\": 1, \"description\": \"A\", \"completed\": \"yes\"}]}",
        "{\"tasks\": [{\"id\": 1, \"description\": \"A\", \"completed\": false},"
        " {\"id\": 1, \"description\": \"B\", \"completed\": true}]}",
    };
    for (const char* text : cases) {
        auto result = Persistence::deserialize(text);
        if (!is_error(result, Kind::Decode)) {
            std::cerr << "[FAIL] accepted malformed input: " << text << std::endl;
            assert(false);
        }
    }
}

void testFileRoundTripAndErrors(const std::filesystem::path& root) {
    using Kind = Persistence::Error::Kind;
    const auto path = root / "tasks.json";
    TaskList tasks = TaskList{}.push_back(Task{1, "A", false}).push_back(Task{2, "B", true});

    assert(!Persistence::save_tasks(path, tasks));
    assert(std::filesystem::exists(path));
    assert(!std::filesystem::exists(root / "tasks.json.tmp"));
    assert(tasks_of(Persistence::load_tasks(path)) == tasks);

    // Overwrite replaces the whole file
    TaskList fewer = TaskList{}.push_back(Task{3, "C", false});
    assert(!Persistence::save_tasks(path, fewer));
    assert(tasks_of(Persistence::load_tasks(path)) == fewer);

    // Missing file and missing directory are I/O errors, not decode errors
    assert(is_error(Persistence::load_tasks(root / "absent.json"), Kind::Io));
    assert(is_error(Persistence::load_tasks(root), Kind::Io));
    auto save_error = Persistence::save_tasks(root / "no_such_dir" / "tasks.json", tasks);
    assert(save_error && save_error->kind == Kind::Io);
    assert(!std::filesystem::exists(root / "no_such_dir"));

    // Rename onto a directory fails after the temp file is written
    const auto dir_target = root / "adir";
    std::filesystem::create_directories(dir_target);
    save_error = Persistence::save_tasks(dir_target, tasks);
    assert(save_error && save_error->kind == Kind::Io);
    assert(std::filesystem::is_directory(dir_target));
    assert(!std::filesystem::exists(root / "adir.tmp"));

    // An unreadable path reports why, not "not found"
    const auto loop_a = root / "loop_a.json";
    const auto loop_b = root / "loop_b.json";
    std::filesystem::create_symlink(loop_b, loop_a);
    std::filesystem::create_symlink(loop_a, loop_b);
    auto looped = Persistence::load_tasks(loop_a);
    assert(is_error(looped, Kind::Io));
    assert(std::get<Persistence::Error>(looped).message.rfind("Cannot access", 0) == 0);
    auto absent = Persistence::load_tasks(root / "absent.json");
    assert(std::get<Persistence::Error>(absent).message.rfind("File not found", 0) == 0);

    // Bad contents are a decode error
    const auto garbage = root / "garbage.json";
    write_file(garbage, "{ this is not json");
    assert(is_error(Persistence::load_tasks(garbage), Kind::Decode));
    write_file(garbage, "");
    assert(is_error(Persistence::load_tasks(garbage), Kind::Decode));
}

} // namespace

int main() {
    std::cout << "[Test] Starting Persistence Test..." << std::endl;

    const std::filesystem::path root = "test_persistence_root";
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);

    testRoundTrip();
    testEncodingIsFieldTagged();
    testUnknownFieldsIgnored();
    testBareArrayFromFirstRelease();
    testMalformedInputRejected();
    testFileRoundTripAndErrors(root);

    std::filesystem::remove_all(root);
    std::cout << "[PASS] Persistence Test." << std::endl;
    return 0;
}
