#pragma once

#include "layout.hpp"
#include "state.hpp"
#include "terminal.hpp"
#include <array>
#include <sstream>
#include <string>
#include <vector>

namespace pkgdash {

// Draws read-only snapshots of AppState. Remembers only presentation state
// of its own (scroll offsets, spinner frame).
class Renderer {
public:
    // Draw one frame and return the regions drawn, for mouse hit-testing
    Layout draw(const AppState& state, Terminal& terminal);

    // Lay out and compose a frame without touching the terminal
    Layout compose(const AppState& state, int rows, int cols, std::ostringstream& output);

private:
    void draw_tab_bar(std::ostringstream& out, const AppState& state, int cols, Layout& layout);
    void draw_filter_bar(std::ostringstream& out, const AppState& state, int cols, Layout& layout);
    void draw_list(std::ostringstream& out, const AppState& state, int cols, Layout& layout);
    void draw_status_bar(std::ostringstream& out, const AppState& state, int cols, const Layout& layout);

    void draw_help(std::ostringstream& out, int rows, int cols);
    void draw_detail(std::ostringstream& out, const AppState& state, const std::string& id,
                     int rows, int cols);
    void draw_confirm(std::ostringstream& out, const OperationKey& key, int rows, int cols);

    // Bordered box centered on screen
    void draw_box(std::ostringstream& out, const std::string& title,
                  const std::vector<std::string>& lines, int rows, int cols);

    std::string operation_marker(const AppState& state, const std::string& package_id) const;
    const char* spinner() const;

    std::array<size_t, VIEW_COUNT> scroll_{};
    size_t tick_ = 0;
};

} // namespace pkgdash
