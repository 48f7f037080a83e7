#pragma once

#include "task.hpp"

#include <filesystem> // Requires C++17
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace Persistence {

struct Error {
    enum class Kind { Io, Decode };
    Kind kind;
    std::string message;
    bool operator==(const Error&) const = default;
};

// Either the decoded list or the reason it could not be produced
using LoadResult = std::variant<TaskList, Error>;

// --- Codec ---
std::string serialize(const TaskList& tasks);
LoadResult deserialize(std::string_view text);

// --- File I/O ---
// Writes through a temporary file and renames it over `path`, so a failed
// save never leaves a truncated file behind.
std::optional<Error> save_tasks(const std::filesystem::path& path, const TaskList& tasks);
LoadResult load_tasks(const std::filesystem::path& path);

} // namespace Persistence
