#pragma once

#include <immer/flex_vector.hpp>
#include <cstdint>
#include <string>

using TaskId = std::uint64_t;

struct Task {
    TaskId id = 0;
    std::string description;
    bool completed = false;
    bool operator==(const Task&) const = default;
};

// Ordered, insertion order unless moved explicitly
using TaskList = immer::flex_vector<Task>;
