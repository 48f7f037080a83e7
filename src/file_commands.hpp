#pragma once

#include "state.hpp"
#include "config.hpp"

#include <filesystem>
#include <functional>
#include <optional>

// Interactive path chooser supplied by the UI. It may answer later, from
// another event, but always on the UI thread. nullopt means cancelled.
class FilePicker {
public:
    using Callback = std::function<void(std::optional<std::filesystem::path>)>;

    virtual ~FilePicker() = default;

    virtual void pick_save_path(const std::filesystem::path& suggested, Callback done) = 0;
    virtual void pick_open_path(const std::filesystem::path& suggested, Callback done) = 0;
};

using Dispatch = std::function<void(Action)>;

// Saves to the current file, or asks for one when there is none yet.
void request_save(const AppState& state, const Dispatch& dispatch, FilePicker& picker,
                  const Config::Settings& settings);
// Always asks, suggesting the current file.
void request_save_as(const AppState& state, const Dispatch& dispatch, FilePicker& picker,
                     const Config::Settings& settings);
void request_load(const AppState& state, const Dispatch& dispatch, FilePicker& picker,
                  const Config::Settings& settings);
