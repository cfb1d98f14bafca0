#pragma once

#include "backend.hpp"
#include "dispatcher.hpp"
#include "layout.hpp"
#include "options.hpp"
#include "render.hpp"
#include "state.hpp"
#include "state_machine.hpp"
#include "terminal.hpp"
#include <memory>
#include <string>

namespace pkgdash {

class App {
public:
    explicit App(Options options);
    ~App();

    // Create the backend; fails when the package manager is missing
    bool init();

    // Use an already constructed backend instead of the configured one
    bool init(BackendPtr backend);

    // Main event loop
    void run();

    const std::string& error() const { return error_; }

private:
    // Apply a message and submit whatever background work it asks for
    void handle(const Message& message);
    void submit(const Effects& effects);

    // Drain finished units of work without blocking
    void process_results();

    Options options_;
    std::string error_;

    // Components
    Terminal terminal_;
    Renderer renderer_;
    BackendPtr backend_;
    InboxPtr inbox_;
    std::unique_ptr<Dispatcher> dispatcher_;

    // State, owned and mutated only by the interactive loop
    AppState state_;
    Layout layout_;
};

// Factory function to create backends by name
BackendPtr create_backend(const std::string& name, const Options& options);

// Open the log, run the dashboard and close the log again on every path.
// Returns the process exit status.
int run_app(const Options& options);

} // namespace pkgdash
