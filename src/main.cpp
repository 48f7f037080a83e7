#include "state.hpp"         // State, Action, Reducer, Effects
#include "config.hpp"        // Settings, config dir, logging
#include "file_commands.hpp" // FilePicker, save/load requests

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>

#include <lager/store.hpp>
#include <lager/watch.hpp>
#include <lager/event_loop/manual.hpp>

// Logging with spdlog
#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <vector>
#include <string>
#include <iostream>

using namespace ftxui;

namespace {

// Path prompt shown as a modal over the task list
class ModalFilePicker : public FilePicker {
public:
    ModalFilePicker() {
        auto input = Input(&buffer_, "path/to/file.json", InputOption{
            .on_enter = [this] { finish(true); }
        });
        auto ok = Button("OK", [this] { finish(true); });
        auto cancel = Button("Cancel", [this] { finish(false); });
        auto layout = Container::Vertical({input, Container::Horizontal({ok, cancel})});
        component_ = Renderer(layout, [this, input, ok, cancel] {
            return vbox({
                    text(title_) | bold,
                    separator(),
                    input->Render() | size(WIDTH, GREATER_THAN, 40),
                    hbox({ok->Render(), cancel->Render()}),
                }) | border;
        });
    }

    void pick_save_path(const std::filesystem::path& suggested, Callback done) override {
        open("Save tasks to", suggested, std::move(done));
    }

    void pick_open_path(const std::filesystem::path& suggested, Callback done) override {
        open("Load tasks from", suggested, std::move(done));
    }

    Component component() const { return component_; }
    bool* shown() { return &shown_; }

private:
    void open(std::string title, const std::filesystem::path& suggested, Callback done) {
        title_ = std::move(title);
        buffer_ = suggested.string();
        pending_ = std::move(done);
        shown_ = true;
    }

    void finish(bool accepted) {
        shown_ = false;
        auto done = std::move(pending_);
        pending_ = nullptr;
        if (!done)
            return;
        if (accepted && !buffer_.empty())
            done(std::filesystem::path(buffer_));
        else
            done(std::nullopt);
    }

    Component component_;
    std::string title_;
    std::string buffer_;
    Callback pending_;
    bool shown_ = false;
};

std::string draft_text(const AppState& state) {
    if (auto* composing = std::get_if<Composing>(&state.edit))
        return composing->draft;
    if (auto* editing = std::get_if<Editing>(&state.edit))
        return editing->draft;
    return {};
}

std::string entry_label(const AppState& state, const Task& task) {
    auto* editing = std::get_if<Editing>(&state.edit);
    std::string label = (task.completed ? "[x] " : "[ ] ") + task.description;
    if (editing && editing->id == task.id)
        label += "  (editing)";
    return label;
}

} // namespace

Component AppUI(lager::store<Action, AppState>& store, ModalFilePicker& picker, const Config::Settings& settings) {
    // Component state that persists with the component
    auto draft_buffer = std::make_shared<std::string>("");
    auto current_selection = std::make_shared<int>(0);
    auto menu_entries = std::make_shared<std::vector<std::string>>();

    Dispatch dispatch = [&store](Action action) { store.dispatch(std::move(action)); };

    auto sync_draft = [&store, draft_buffer] { *draft_buffer = draft_text(store.get()); };

    auto selected_id = [&store, current_selection]() -> std::optional<TaskId> {
        const auto& tasks = store->tasks;
        if (*current_selection < 0 || static_cast<std::size_t>(*current_selection) >= tasks.size())
            return std::nullopt;
        return tasks[static_cast<std::size_t>(*current_selection)].id;
    };

    auto commit = [&store, dispatch, sync_draft] {
        if (std::holds_alternative<Composing>(store->edit))
            dispatch(CommitComposeAction{});
        else if (std::holds_alternative<Editing>(store->edit))
            dispatch(CommitEditAction{});
        sync_draft();
    };
    auto cancel = [&store, dispatch, sync_draft] {
        if (std::holds_alternative<Composing>(store->edit))
            dispatch(CancelComposeAction{});
        else if (std::holds_alternative<Editing>(store->edit))
            dispatch(CancelEditAction{});
        sync_draft();
    };
    auto with_selected = [selected_id, dispatch](auto make_action) {
        return [selected_id, dispatch, make_action] {
            if (auto id = selected_id())
                dispatch(make_action(*id));
        };
    };

    // Draft input, only shown while composing or editing
    auto draft_input = Input(
        draft_buffer.get(),
        "Task description",
        InputOption{
            .on_change = [dispatch, draft_buffer] {
                dispatch(UpdateDraftAction{*draft_buffer});
            },
            .on_enter = commit
        });
    auto draft_row = Maybe(draft_input, [&store] { return !std::holds_alternative<Idle>(store->edit); });

    auto menu_options = MenuOption::Vertical();
    menu_options.on_enter = with_selected([](TaskId id) { return Action{ToggleCompleteAction{id}}; });
    auto todo_menu = Menu(menu_entries.get(), current_selection.get(), menu_options);

    // Buttons
    auto new_button = Button("New", [dispatch, sync_draft] {
        dispatch(BeginComposeAction{});
        sync_draft();
    });
    auto edit_button = Button("Edit", [selected_id, dispatch, sync_draft] {
        if (auto id = selected_id()) {
            dispatch(BeginEditAction{*id});
            sync_draft();
        }
    });
    auto done_button = Button("Done", commit);
    auto cancel_button = Button("Cancel", cancel);
    auto toggle_button = Button("Toggle", with_selected([](TaskId id) { return Action{ToggleCompleteAction{id}}; }));
    auto delete_button = Button("Delete", [selected_id, dispatch, sync_draft] {
        if (auto id = selected_id()) {
            dispatch(DeleteTaskAction{*id});
            sync_draft();
        }
    });
    auto up_button = Button("Up", [selected_id, dispatch, current_selection] {
        if (auto id = selected_id()) {
            dispatch(MoveTaskAction{*id, -1});
            *current_selection = std::max(0, *current_selection - 1);
        }
    });
    auto down_button = Button("Down", [&store, selected_id, dispatch, current_selection] {
        if (auto id = selected_id()) {
            dispatch(MoveTaskAction{*id, 1});
            *current_selection = std::min(static_cast<int>(store->tasks.size()) - 1, *current_selection + 1);
        }
    });
    auto save_button = Button("Save", [&store, &picker, &settings, dispatch] {
        request_save(store.get(), dispatch, picker, settings);
    });
    auto save_as_button = Button("Save As", [&store, &picker, &settings, dispatch] {
        request_save_as(store.get(), dispatch, picker, settings);
    });
    auto load_button = Button("Load", [&store, &picker, &settings, dispatch] {
        request_load(store.get(), dispatch, picker, settings);
    });
    auto quit_button = Button("Quit", [dispatch] {
        dispatch(QuitAction{});
    });

    auto task_buttons = Container::Horizontal({
            new_button, edit_button, done_button, cancel_button,
            toggle_button, delete_button, up_button, down_button
        });
    auto file_buttons = Container::Horizontal({
            save_button, save_as_button, load_button, quit_button
        });

    // Layout container with all focusable components
    auto main_container = Container::Vertical({
            draft_row,
            todo_menu,
            task_buttons,
            file_buttons
        });

    auto main_view = Renderer(main_container, [&store, menu_entries, current_selection, draft_row, todo_menu,
                                               task_buttons, file_buttons] {
        const auto& state = store.get();
        menu_entries->clear();
        for (const auto& task : state.tasks)
            menu_entries->push_back(entry_label(state, task));
        if (*current_selection >= static_cast<int>(menu_entries->size()))
            *current_selection = std::max(0, static_cast<int>(menu_entries->size()) - 1);

        std::string title = "Taskpad";
        if (state.current_file)
            title += " - " + state.current_file->filename().string();
        if (state.dirty)
            title += " *";

        auto status = text("Status: " + state.status_message);
        status = state.last.ok ? status | dim : status | color(Color::Red);

        return vbox({
                text(title) | bold | hcenter,
                separator(),
                draft_row->Render(),
                todo_menu->Render() | frame | flex_grow,
                separator(),
                task_buttons->Render(),
                file_buttons->Render(),
                separator(),
                status  // Status text (not focusable)
            }) | border;
    });

    return main_view | Modal(picker.component(), picker.shown()) | CatchEvent([&store, &picker, dispatch](Event event) {
        // 'q' is plain text while a draft or the path prompt is open
        if (event == Event::Character('q') && std::holds_alternative<Idle>(store->edit) && !*picker.shown()) {
            dispatch(QuitAction{});
            return true;
        }
        return false;  // Allow other events to pass through
    });
}


int main() {
    // --- Determine Paths FIRST ---
    std::filesystem::path config_dir;
    try {
        config_dir = Config::get_config_dir();
    } catch (const std::exception& e) {
        std::cerr << "Error determining file paths: " << e.what() << std::endl;
        return 1;
    }

    const auto settings = Config::load_settings(config_dir / "settings.json");

    // --- Logger Setup (spdlog) ---
    const auto log_file_path = config_dir / "taskpad_log.txt";
    try {
        Config::init_logging(settings, log_file_path);
        spdlog::info("--- Log Start ---");
        spdlog::info("Logging to: {}", log_file_path.string());
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return 1;
    }

    spdlog::info("Application starting");

    // --- FTXUI Screen ---
    auto screen = ScreenInteractive::Fullscreen();

    // --- Lager Store Setup ---
    // No file is opened at startup: the list starts empty until Load.
    auto store = lager::make_store<Action>(
        AppState{},
        lager::with_manual_event_loop{},
        lager::with_reducer(reducer)
        );

    // --- Connect Lager Store to FTXUI ---
    lager::watch(
        store,
        [&](AppState const& state) {
            if (state.exit_requested) {
                spdlog::info("Exit requested flag detected, stopping loop.");
                screen.Exit();
            } else {
                // Only trigger redraw if not exiting
                screen.PostEvent(Event::Custom);
            }
        });

    // --- Build UI ---
    ModalFilePicker picker;
    auto ui = AppUI(store, picker, settings);

    // --- Run Event Loop ---
    spdlog::info("Starting UI loop");
    screen.Loop(ui);

    // --- Cleanup ---
    if (store->dirty)
        spdlog::warn("Exiting with unsaved changes");
    spdlog::info("Application finished cleanly");
    spdlog::shutdown(); // Flush and release logger resources
    return 0;
}
