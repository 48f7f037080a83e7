#include "file_commands.hpp"

#include <spdlog/spdlog.h>

namespace {

std::filesystem::path suggestion(const AppState& state, const Config::Settings& settings) {
    return state.current_file.value_or(std::filesystem::path(settings.default_file_name));
}

// A draft must be finished first; let the reducer report Busy rather than
// opening a dialog whose answer would be rejected anyway.
bool has_draft(const AppState& state) {
    return !std::holds_alternative<Idle>(state.edit);
}

template <typename FileAction>
FilePicker::Callback dispatch_picked(const Dispatch& dispatch, const char* what) {
    return [dispatch, what](std::optional<std::filesystem::path> picked) {
        if (!picked || picked->empty()) {
            spdlog::info("{} cancelled", what);
            return;
        }
        dispatch(FileAction{std::move(*picked)});
    };
}

} // namespace

void request_save(const AppState& state, const Dispatch& dispatch, FilePicker& picker,
                  const Config::Settings& settings) {
    if (has_draft(state) || state.current_file) {
        dispatch(SaveAction{suggestion(state, settings)});
        return;
    }
    request_save_as(state, dispatch, picker, settings);
}

void request_save_as(const AppState& state, const Dispatch& dispatch, FilePicker& picker,
                     const Config::Settings& settings) {
    if (has_draft(state)) {
        dispatch(SaveAction{suggestion(state, settings)});
        return;
    }
    picker.pick_save_path(suggestion(state, settings), dispatch_picked<SaveAction>(dispatch, "Save"));
}

void request_load(const AppState& state, const Dispatch& dispatch, FilePicker& picker,
                  const Config::Settings& settings) {
    if (has_draft(state)) {
        dispatch(LoadAction{suggestion(state, settings)});
        return;
    }
    picker.pick_open_path(suggestion(state, settings), dispatch_picked<LoadAction>(dispatch, "Load"));
}
