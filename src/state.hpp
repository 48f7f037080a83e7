#pragma once

#include <lager/effect.hpp>
#include <lager/context.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "task.hpp"
#include "persistence.hpp" // For Persistence::Error / LoadResult

// --- Data Structures ---

// Exactly one draft at a time: either a new task being composed or an
// existing task being edited, never both.
struct Idle {
    bool operator==(const Idle&) const = default;
};
struct Composing {
    std::string draft;
    bool operator==(const Composing&) const = default;
};
struct Editing {
    TaskId id = 0;
    std::string draft;
    bool operator==(const Editing&) const = default;
};
using EditState = std::variant<Idle, Composing, Editing>;

enum class ErrorKind {
    NotFound,  // no task with the given id
    Busy,      // another draft is active
    NoDraft,   // draft operation without a matching draft
    Exhausted, // no unused task id left
    Decode,
    Io,
};

const char* to_string(ErrorKind kind);

// Result of the most recent action, for the UI to react on
struct Outcome {
    bool ok = true;
    std::optional<TaskId> task_id;
    std::optional<ErrorKind> error;
    bool operator==(const Outcome&) const = default;
};

struct AppState {
    TaskList tasks;
    EditState edit = Idle{};
    TaskId next_id = 1;
    std::optional<std::filesystem::path> current_file; // set after a successful save/load
    bool dirty = false;
    Outcome last;
    std::string status_message = "Ready";
    bool exit_requested = false; // Flag for clean exit

    bool operator==(const AppState&) const = default;
};

const Task* find_task(const AppState& state, TaskId id);

// --- Actions ---
struct BeginComposeAction {};
struct BeginEditAction { TaskId id; };
struct UpdateDraftAction { std::string text; };
struct CommitComposeAction {};
struct CancelComposeAction {};
struct CommitEditAction {};
struct CancelEditAction {};
struct ToggleCompleteAction { TaskId id; };
struct DeleteTaskAction { TaskId id; };
struct MoveTaskAction { TaskId id; int offset; };
struct SaveAction { std::filesystem::path path; };
struct LoadAction { std::filesystem::path path; };
struct SaveCompleteAction { std::filesystem::path path; TaskList saved; std::optional<Persistence::Error> error; };
struct LoadCompleteAction { std::filesystem::path path; Persistence::LoadResult result; };
struct SetStatusAction { std::string message; };
struct QuitAction {};

using Action = std::variant<BeginComposeAction, BeginEditAction, UpdateDraftAction, CommitComposeAction,
                            CancelComposeAction, CommitEditAction, CancelEditAction, ToggleCompleteAction,
                            DeleteTaskAction, MoveTaskAction, SaveAction, LoadAction, SaveCompleteAction,
                            LoadCompleteAction, SetStatusAction, QuitAction>;

// --- Effect Type Alias ---
using AppEffect = lager::effect<Action>;

// --- Reducer ---
// Pure apart from the returned effect; save/load I/O happens in the effect,
// which reports back with SaveCompleteAction / LoadCompleteAction.
std::pair<AppState, AppEffect> reducer(AppState current_state, const Action& action);
