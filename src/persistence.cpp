#include "persistence.hpp"
#include <nlohmann/json.hpp> // JSON library
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <unordered_set>
#include <vector>

// --- JSON Serialization Helpers ---

void to_json(nlohmann::json& j, const Task& task) {
    j = nlohmann::json{{"id", task.id}, {"description", task.description}, {"completed", task.completed}};
}

// Unknown keys are left alone so newer files still load
void from_json(const nlohmann::json& j, Task& task) {
    j.at("id").get_to(task.id);
    j.at("description").get_to(task.description);
    j.at("completed").get_to(task.completed);
}

namespace {

constexpr int format_version = 1;

// Structural problems nlohmann itself does not flag
struct DecodeFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

const nlohmann::json& task_array(const nlohmann::json& j) {
    // Files written by the first release are a bare array of tasks
    if (j.is_array())
        return j;
    if (!j.is_object())
        throw DecodeFailure("top level must be an object or an array");
    auto it = j.find("tasks");
    if (it == j.end())
        throw DecodeFailure("missing 'tasks'");
    if (!it->is_array())
        throw DecodeFailure("'tasks' must be an array");
    return *it;
}

TaskList decode_tasks(const nlohmann::json& j) {
    auto result = TaskList{}.transient();
    std::unordered_set<TaskId> seen;
    std::size_t index = 0;
    for (const auto& entry : task_array(j)) {
        if (!entry.is_object())
            throw DecodeFailure("task " + std::to_string(index) + " is not an object");
        // get_to would silently wrap negative or fractional numbers
        if (entry.contains("id") && !entry["id"].is_number_unsigned())
            throw DecodeFailure("task " + std::to_string(index) + " has a non-integer or negative id");
        Task task = entry.get<Task>();
        // The largest id is never allocated, so next_id = max + 1 cannot wrap
        if (task.id == std::numeric_limits<TaskId>::max())
            throw DecodeFailure("task " + std::to_string(index) + " id out of range");
        if (!seen.insert(task.id).second)
            throw DecodeFailure("duplicate task id " + std::to_string(task.id));
        result.push_back(std::move(task));
        ++index;
    }
    return result.persistent();
}

} // namespace


namespace Persistence {

std::string serialize(const TaskList& tasks) {
    // Convert immer::flex_vector to std::vector for serialization
    std::vector<Task> tasks_vec(tasks.begin(), tasks.end());
    nlohmann::json j = {{"version", format_version}, {"tasks", tasks_vec}};
    // Replace invalid UTF-8 instead of throwing from dump()
    return j.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
}

LoadResult deserialize(std::string_view text) {
    try {
        auto j = nlohmann::json::parse(text.begin(), text.end());
        return decode_tasks(j);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("JSON parsing error at byte {}: {}", e.byte, e.what());
        return Error{Error::Kind::Decode, "Malformed JSON: " + std::string(e.what())};
    } catch (const nlohmann::json::exception& e) { // Missing keys, wrong types
        spdlog::warn("JSON processing error: {}", e.what());
        return Error{Error::Kind::Decode, "Invalid task data: " + std::string(e.what())};
    } catch (const DecodeFailure& e) {
        spdlog::warn("Task list rejected: {}", e.what());
        return Error{Error::Kind::Decode, "Invalid task data: " + std::string(e.what())};
    }
}

std::optional<Error> save_tasks(const std::filesystem::path& path, const TaskList& tasks) {
    const std::string content = serialize(tasks);

    auto temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream ofs(temp_path, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            spdlog::error("Error opening file for writing: {}", temp_path.string());
            return Error{Error::Kind::Io, "Cannot write " + path.string()};
        }
        ofs << content;
        ofs.flush();
        if (!ofs) {
            spdlog::error("Write to {} failed", temp_path.string());
            ofs.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return Error{Error::Kind::Io, "Write failed for " + path.string()};
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        spdlog::error("Rename {} -> {} failed: {}", temp_path.string(), path.string(), ec.message());
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        return Error{Error::Kind::Io, "Cannot replace " + path.string() + ": " + ec.message()};
    }
    return std::nullopt;
}

LoadResult load_tasks(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        if (ec) {
            spdlog::error("Cannot access {}: {}", path.string(), ec.message());
            return Error{Error::Kind::Io, "Cannot access " + path.string() + ": " + ec.message()};
        }
        spdlog::warn("Not a readable file: {}", path.string());
        return Error{Error::Kind::Io, "File not found: " + path.string()};
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        spdlog::error("Error opening file for reading: {}", path.string());
        return Error{Error::Kind::Io, "Cannot open " + path.string()};
    }
    std::string content{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
    if (ifs.bad()) {
        spdlog::error("Read from {} failed", path.string());
        return Error{Error::Kind::Io, "Read failed for " + path.string()};
    }
    return deserialize(content);
}

} // namespace Persistence
