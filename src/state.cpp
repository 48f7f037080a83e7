#include "state.hpp"

#include <lager/util.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <type_traits>

namespace {

using Result = std::pair<AppState, AppEffect>;

std::string trim(const std::string& text) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto first = std::find_if_not(text.begin(), text.end(), is_space);
    auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    return first < last ? std::string(first, last) : std::string{};
}

std::optional<std::size_t> index_of(const TaskList& tasks, TaskId id) {
    auto it = std::find_if(tasks.begin(), tasks.end(), [id](const Task& t) { return t.id == id; });
    if (it == tasks.end())
        return std::nullopt;
    return static_cast<std::size_t>(std::distance(tasks.begin(), it));
}

TaskId next_id_after(const TaskList& tasks) {
    TaskId max_id = 0;
    for (const auto& task : tasks)
        max_id = std::max(max_id, task.id);
    return max_id + 1;
}

ErrorKind error_kind(const Persistence::Error& error) {
    return error.kind == Persistence::Error::Kind::Io ? ErrorKind::Io : ErrorKind::Decode;
}

Result accept(AppState state, std::string message, std::optional<TaskId> id = std::nullopt) {
    state.last = Outcome{true, id, std::nullopt};
    state.status_message = std::move(message);
    return {std::move(state), lager::noop};
}

Result reject(AppState state, ErrorKind kind, std::string message, std::optional<TaskId> id = std::nullopt) {
    spdlog::debug("Rejected ({}): {}", to_string(kind), message);
    state.last = Outcome{false, id, kind};
    state.status_message = std::move(message);
    return {std::move(state), lager::noop};
}

Result busy(AppState state, std::optional<TaskId> id = std::nullopt) {
    return reject(std::move(state), ErrorKind::Busy, "Finish or cancel the current draft first.", id);
}

Result not_found(AppState state, TaskId id) {
    return reject(std::move(state), ErrorKind::NotFound, "No task with id " + std::to_string(id) + ".", id);
}

// --- Effect Implementations ---

AppEffect save_effect(std::filesystem::path path, TaskList tasks) {
    return [path, tasks](const lager::context<Action>& ctx) {
        spdlog::debug("Executing save effect to {}", path.string());
        auto error = Persistence::save_tasks(path, tasks);
        if (error)
            spdlog::error("Save failed: {}", error->message);
        else
            spdlog::info("Saved {} tasks to {}", tasks.size(), path.string());
        ctx.dispatch(SaveCompleteAction{path, tasks, std::move(error)});
    };
}

AppEffect load_effect(std::filesystem::path path) {
    return [path](const lager::context<Action>& ctx) {
        spdlog::debug("Executing load effect from {}", path.string());
        auto result = Persistence::load_tasks(path);
        if (auto* error = std::get_if<Persistence::Error>(&result))
            spdlog::error("Load failed: {}", error->message);
        else
            spdlog::info("Loaded {} tasks from {}", std::get<TaskList>(result).size(), path.string());
        ctx.dispatch(LoadCompleteAction{path, std::move(result)});
    };
}

} // namespace

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound: return "not found";
    case ErrorKind::Busy: return "busy";
    case ErrorKind::NoDraft: return "no draft";
    case ErrorKind::Exhausted: return "ids exhausted";
    case ErrorKind::Decode: return "decode error";
    case ErrorKind::Io: return "I/O error";
    }
    return "unknown";
}

const Task* find_task(const AppState& state, TaskId id) {
    auto index = index_of(state.tasks, id);
    return index ? &state.tasks[*index] : nullptr;
}

// --- Reducer Implementation ---
std::pair<AppState, AppEffect> reducer(AppState current_state, const Action& action) {
    return lager::match(action)(
        // --- Compose ---
        [&](const BeginComposeAction&) -> Result {
            if (!std::holds_alternative<Idle>(current_state.edit))
                return busy(std::move(current_state));
            current_state.edit = Composing{};
            return accept(std::move(current_state), "New task: type a description.");
        },
        [&](const CommitComposeAction&) -> Result {
            auto* composing = std::get_if<Composing>(&current_state.edit);
            if (!composing)
                return reject(std::move(current_state), ErrorKind::NoDraft, "No new task in progress.");
            auto description = trim(composing->draft);
            if (description.empty()) {
                current_state.edit = Idle{};
                return accept(std::move(current_state), "Empty task discarded.");
            }
            // The largest id is a sentinel: allocating it would wrap next_id
            if (current_state.next_id == std::numeric_limits<TaskId>::max())
                return reject(std::move(current_state), ErrorKind::Exhausted, "No task ids left.");
            current_state.edit = Idle{};
            const TaskId id = current_state.next_id++;
            current_state.tasks = current_state.tasks.push_back(Task{id, std::move(description), false});
            current_state.dirty = true;
            spdlog::trace("Task {} added", id);
            return accept(std::move(current_state), "Task added.", id);
        },
        [&](const CancelComposeAction&) -> Result {
            if (!std::holds_alternative<Composing>(current_state.edit))
                return reject(std::move(current_state), ErrorKind::NoDraft, "No new task in progress.");
            current_state.edit = Idle{};
            return accept(std::move(current_state), "Draft discarded.");
        },
        // --- Edit ---
        [&](const BeginEditAction& act) -> Result {
            if (!std::holds_alternative<Idle>(current_state.edit))
                return busy(std::move(current_state), act.id);
            const Task* task = find_task(current_state, act.id);
            if (!task)
                return not_found(std::move(current_state), act.id);
            current_state.edit = Editing{act.id, task->description};
            return accept(std::move(current_state), "Editing task.", act.id);
        },
        [&](const CommitEditAction&) -> Result {
            auto* editing = std::get_if<Editing>(&current_state.edit);
            if (!editing)
                return reject(std::move(current_state), ErrorKind::NoDraft, "No task is being edited.");
            const Editing finished = std::move(*editing);
            current_state.edit = Idle{};
            auto index = index_of(current_state.tasks, finished.id);
            if (!index)
                return not_found(std::move(current_state), finished.id);
            // Empty descriptions are accepted here, unlike compose
            Task task = current_state.tasks[*index];
            if (task.description != finished.draft) {
                task.description = finished.draft;
                current_state.tasks = current_state.tasks.set(*index, std::move(task));
                current_state.dirty = true;
            }
            spdlog::trace("Task {} edited", finished.id);
            return accept(std::move(current_state), "Task updated.", finished.id);
        },
        [&](const CancelEditAction&) -> Result {
            auto* editing = std::get_if<Editing>(&current_state.edit);
            if (!editing)
                return reject(std::move(current_state), ErrorKind::NoDraft, "No task is being edited.");
            const TaskId id = editing->id;
            current_state.edit = Idle{};
            return accept(std::move(current_state), "Edit cancelled.", id);
        },
        [&](const UpdateDraftAction& act) -> Result {
            return std::visit(
                [&](auto& draft_state) -> Result {
                    using T = std::decay_t<decltype(draft_state)>;
                    if constexpr (std::is_same_v<T, Idle>) {
                        return reject(std::move(current_state), ErrorKind::NoDraft, "Nothing to type into.");
                    } else {
                        draft_state.draft = act.text;
                        std::optional<TaskId> id;
                        if constexpr (std::is_same_v<T, Editing>)
                            id = draft_state.id;
                        current_state.last = Outcome{true, id, std::nullopt};
                        return {std::move(current_state), lager::noop};
                    }
                },
                current_state.edit);
        },
        // --- Task mutations, valid in any edit state ---
        [&](const ToggleCompleteAction& act) -> Result {
            auto index = index_of(current_state.tasks, act.id);
            if (!index)
                return not_found(std::move(current_state), act.id);
            Task task = current_state.tasks[*index];
            task.completed = !task.completed;
            const bool completed = task.completed;
            current_state.tasks = current_state.tasks.set(*index, std::move(task));
            current_state.dirty = true;
            return accept(std::move(current_state), completed ? "Task completed." : "Task reopened.", act.id);
        },
        [&](const DeleteTaskAction& act) -> Result {
            auto index = index_of(current_state.tasks, act.id);
            if (!index)
                return not_found(std::move(current_state), act.id);
            current_state.tasks = current_state.tasks.erase(*index);
            current_state.dirty = true;
            auto* editing = std::get_if<Editing>(&current_state.edit);
            if (editing && editing->id == act.id) {
                spdlog::debug("Task {} deleted while being edited, draft dropped", act.id);
                current_state.edit = Idle{};
            }
            return accept(std::move(current_state), "Task deleted.", act.id);
        },
        [&](const MoveTaskAction& act) -> Result {
            auto index = index_of(current_state.tasks, act.id);
            if (!index)
                return not_found(std::move(current_state), act.id);
            const auto last_index = static_cast<long>(current_state.tasks.size()) - 1;
            const auto target =
                static_cast<std::size_t>(std::clamp(static_cast<long>(*index) + act.offset, 0L, last_index));
            if (target != *index) {
                Task task = current_state.tasks[*index];
                current_state.tasks = current_state.tasks.erase(*index).insert(target, std::move(task));
                current_state.dirty = true;
            }
            return accept(std::move(current_state), "Task moved.", act.id);
        },
        // --- Effects ---
        [&](const SaveAction& act) -> Result {
            if (!std::holds_alternative<Idle>(current_state.edit))
                return busy(std::move(current_state));
            current_state.status_message = "Saving...";
            auto effect = save_effect(act.path, current_state.tasks);
            return {std::move(current_state), std::move(effect)};
        },
        [&](const LoadAction& act) -> Result {
            if (!std::holds_alternative<Idle>(current_state.edit))
                return busy(std::move(current_state));
            current_state.status_message = "Loading...";
            return {std::move(current_state), load_effect(act.path)};
        },
        [&](const SaveCompleteAction& act) -> Result {
            if (act.error)
                return reject(std::move(current_state), error_kind(*act.error), "Save failed: " + act.error->message);
            current_state.current_file = act.path;
            // Edits made while the write was in flight are still unsaved
            current_state.dirty = current_state.tasks != act.saved;
            return accept(std::move(current_state), "Saved to " + act.path.string() + ".");
        },
        [&](const LoadCompleteAction& act) -> Result {
            if (auto* error = std::get_if<Persistence::Error>(&act.result))
                return reject(std::move(current_state), error_kind(*error), "Load failed: " + error->message);
            // The loaded file is authoritative: any draft started meanwhile is dropped
            if (!std::holds_alternative<Idle>(current_state.edit))
                spdlog::info("Load completed during an active draft, discarding it");
            current_state.tasks = std::get<TaskList>(act.result);
            current_state.next_id = next_id_after(current_state.tasks);
            current_state.edit = Idle{};
            current_state.current_file = act.path;
            current_state.dirty = false;
            auto message = "Loaded " + std::to_string(current_state.tasks.size()) + " tasks from " + act.path.string() + ".";
            return accept(std::move(current_state), std::move(message));
        },
        // --- Other ---
        [&](const SetStatusAction& act) -> Result {
            current_state.status_message = act.message;
            return {std::move(current_state), lager::noop};
        },
        [&](const QuitAction&) -> Result {
            current_state.exit_requested = true;
            current_state.status_message = "Exiting...";
            return {std::move(current_state), lager::noop};
        }
        ); // End lager::match
}
