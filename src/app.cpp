#include "app.hpp"
#include "input.hpp"
#include "log.hpp"
#include "providers/winget.hpp"
#include <cstdio>

namespace pkgdash {

BackendPtr create_backend(const std::string& name, const Options& options) {
    if (name == "winget") {
        WingetBackend::Options backend_options;
        backend_options.executable = options.winget_path;
        backend_options.timeout_seconds = options.timeout_seconds;
        return std::make_shared<WingetBackend>(backend_options);
    }
    return nullptr;
}

App::App(Options options)
    : options_(std::move(options)),
      inbox_(std::make_shared<Inbox>()) {
    state_.view = options_.initial_view;
    state_.query = options_.initial_query;
    state_.confirm_actions = options_.confirm_actions;
}

App::~App() {
    terminal_.leave_fullscreen();
    terminal_.restore();
}

bool App::init() {
    BackendPtr backend = create_backend("winget", options_);
    if (!backend || !backend->is_available()) {
        error_ = "Package manager '" + options_.winget_path + "' not available";
        log_error(error_);
        return false;
    }
    return init(std::move(backend));
}

bool App::init(BackendPtr backend) {
    if (!backend) {
        error_ = "No backend";
        return false;
    }
    backend_ = std::move(backend);
    dispatcher_ = std::make_unique<Dispatcher>(backend_, inbox_);
    log_info("using backend " + backend_->name());
    return true;
}

void App::run() {
    if (!terminal_.setup_raw_mode()) {
        error_ = "Failed to set up the terminal";
        log_error(error_);
        return;
    }
    terminal_.enter_fullscreen();
    terminal_.hide_cursor();
    terminal_.clear_screen();

    submit(start(state_));

    while (!state_.should_quit) {
        process_results();

        layout_ = renderer_.draw(state_, terminal_);

        // Returns after ~100ms without input so results keep flowing in
        InputEvent event = terminal_.read_event();
        if (event.type == InputEvent::Type::None) {
            continue;
        }

        KeyCommand cmd = map_input(event, make_input_context(state_, layout_));
        if (cmd.type != CommandType::None) {
            handle(cmd);
        }
    }

    // Outstanding units of work are abandoned; the package manager keeps going
    if (dispatcher_->active_count() > 0) {
        log_info("quitting with " + std::to_string(dispatcher_->active_count()) +
                 " operation(s) still running");
    }

    // Clear screen before exit
    terminal_.clear_screen();
    terminal_.leave_fullscreen();
    terminal_.restore();
    terminal_.show_cursor();
}

void App::handle(const Message& message) {
    submit(apply(state_, message));
}

void App::submit(const Effects& effects) {
    for (const auto& request : effects) {
        OperationHandle submitted = dispatcher_->submit(request);
        handle(DispatchAck{submitted});
    }
}

void App::process_results() {
    while (auto result = inbox_->try_pop()) {
        handle(std::move(*result));
    }
}

int run_app(const Options& options) {
    if (!options.log_path.empty() && !log_open(options.log_path)) {
        fprintf(stderr, "Error: cannot open log file '%s'\n", options.log_path.c_str());
        return 1;
    }

    std::string error;
    {
        App app(options);
        if (app.init()) {
            app.run();
        }
        error = app.error();
    }
    log_close();

    if (!error.empty()) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return 1;
    }
    return 0;
}

} // namespace pkgdash
