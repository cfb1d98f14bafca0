#include "render.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>

namespace pkgdash {

namespace {

constexpr const char* TITLE = " pkgdash ";
constexpr int FILTER_WIDTH = 22;
constexpr int VERSION_WIDTH = 14;
constexpr int SOURCE_WIDTH = 9;
constexpr int STATUS_WIDTH = 16;

void goto_row(std::ostringstream& out, int row, int col = 0) {
    out << "\033[" << (row + 1) << ";" << (col + 1) << "H";
}

} // anonymous namespace

Layout Renderer::draw(const AppState& state, Terminal& terminal) {
    terminal.update_size();

    std::ostringstream output;
    Layout layout = compose(state, terminal.rows(), terminal.cols(), output);

    terminal.write(output.str());
    terminal.flush();
    return layout;
}

Layout Renderer::compose(const AppState& state, int rows, int cols, std::ostringstream& output) {
    ++tick_;
    Layout layout;

    // Move to home position and clear screen
    output << "\033[H\033[J";

    draw_tab_bar(output, state, cols, layout);
    draw_filter_bar(output, state, cols, layout);

    layout.package_list = {0, 2, cols, std::max(2, rows - 3)};
    draw_list(output, state, cols, layout);

    layout.status_bar = {0, rows - 1, cols, 1};
    draw_status_bar(output, state, cols, layout);

    if (std::holds_alternative<HelpOverlay>(state.overlay)) {
        draw_help(output, rows, cols);
    } else if (const auto* detail = std::get_if<DetailOverlay>(&state.overlay)) {
        draw_detail(output, state, detail->package_id, rows, cols);
    } else if (const auto* confirm = std::get_if<ConfirmOverlay>(&state.overlay)) {
        draw_confirm(output, confirm->key, rows, cols);
    }

    // Park the cursor at the end of the query while typing
    if (state.input_mode == InputMode::Search) {
        int cursor_x = layout.search_bar.x + 9 + static_cast<int>(display_width(state.query));
        goto_row(output, layout.search_bar.y, std::min(cursor_x, cols - 1));
        output << "\033[?25h";
    } else {
        output << "\033[?25l";
    }

    return layout;
}

void Renderer::draw_tab_bar(std::ostringstream& out, const AppState& state, int cols,
                            Layout& layout) {
    layout.tab_bar = {0, 0, cols, 1};
    goto_row(out, 0);

    out << Terminal::GREEN << Terminal::BOLD << TITLE << Terminal::RESET << "  ";
    int x = static_cast<int>(display_width(TITLE)) + 2;

    for (View view : {View::Search, View::Installed, View::Upgrades}) {
        std::string label = " " + view_label(view) + " ";
        int width = static_cast<int>(display_width(label));

        if (view == state.view) {
            out << Terminal::BLACK << Terminal::BG_CYAN << Terminal::BOLD;
        } else {
            out << Terminal::GRAY;
        }
        out << label << Terminal::RESET << " ";

        layout.tabs.push_back({x, x + width, view});
        x += width + 1;
    }
    out << "\033[K";
}

void Renderer::draw_filter_bar(std::ostringstream& out, const AppState& state, int cols,
                               Layout& layout) {
    int filter_width = std::min(FILTER_WIDTH, cols);
    layout.filter_bar = {0, 1, filter_width, 1};
    layout.search_bar = {filter_width, 1, std::max(0, cols - filter_width), 1};

    goto_row(out, 1);
    out << Terminal::YELLOW
        << fit_width(" Filter: [" + filter_name(state.filter) + "] ", filter_width)
        << Terminal::RESET;

    int search_width = layout.search_bar.width;
    if (state.input_mode == InputMode::Search) {
        out << Terminal::WHITE << Terminal::BG_GRAY
            << fit_width(" Search: " + state.query, search_width);
    } else if (state.query.empty()) {
        out << Terminal::GRAY << fit_width(" / to search...", search_width);
    } else {
        out << Terminal::DIM << fit_width(" Search: " + state.query, search_width);
    }
    out << Terminal::RESET << "\033[K";
}

void Renderer::draw_list(std::ostringstream& out, const AppState& state, int cols,
                         Layout& layout) {
    const ViewState& list = state.current();
    const Rect& area = layout.package_list;
    bool upgrades = (state.view == View::Upgrades);

    layout.list_content_y = area.y + 1;
    layout.list_rows = std::max(1, area.height - 1);
    layout.scrollbar = {cols - 1, layout.list_content_y, 1, layout.list_rows};

    // Column widths: marker, name, id, version, [available], source, status
    int fixed = 2 + VERSION_WIDTH + SOURCE_WIDTH + STATUS_WIDTH + (upgrades ? VERSION_WIDTH : 0) + 1;
    int flexible = std::max(16, cols - fixed);
    int name_width = flexible * 45 / 100;
    int id_width = flexible - name_width;

    auto row_text = [&](const std::string& name, const std::string& id, const std::string& version,
                        const std::string& available, const std::string& source,
                        const std::string& status) {
        std::string text = fit_width(name, name_width) + fit_width(id, id_width) +
                           fit_width(version, VERSION_WIDTH);
        if (upgrades) text += fit_width(available, VERSION_WIDTH);
        text += fit_width(source, SOURCE_WIDTH) + status;
        return fit_width(text, static_cast<size_t>(std::max(0, cols - 3)));
    };

    // Header
    goto_row(out, area.y);
    out << Terminal::CYAN << Terminal::BOLD << "  "
        << row_text("Name", "Id", "Version", "Available", "Source", "Status")
        << Terminal::RESET << "\033[K";

    size_t count = list.visible.size();
    size_t rows = static_cast<size_t>(layout.list_rows);
    size_t& offset = scroll_[static_cast<size_t>(state.view)];

    // Keep the selection on screen
    if (list.cursor) {
        size_t cursor = *list.cursor;
        if (cursor < offset) offset = cursor;
        if (cursor >= offset + rows) offset = cursor - rows + 1;
    }
    offset = std::min(offset, count > rows ? count - rows : 0);
    layout.first_index = offset;

    // Scrollbar thumb
    int thumb_start = 0;
    int thumb_size = static_cast<int>(rows);
    if (count > rows) {
        thumb_size = std::max(1, static_cast<int>(rows * rows / count));
        thumb_start = static_cast<int>((rows - thumb_size) * offset / (count - rows));
    }

    for (size_t i = 0; i < rows; ++i) {
        int row = layout.list_content_y + static_cast<int>(i);
        goto_row(out, row);

        size_t index = offset + i;
        const Package* pkg = visible_at(list, index);
        if (pkg != nullptr) {
            bool selected = list.cursor && *list.cursor == index;
            if (selected) {
                out << Terminal::BLACK << Terminal::BG_CYAN << Terminal::BOLD << "> ";
            } else {
                out << "  ";
            }
            out << row_text(pkg->name, pkg->id, pkg->version,
                            pkg->available_version.value_or(""),
                            source_name(pkg->source),
                            operation_marker(state, pkg->id));
            out << Terminal::RESET;
        } else if (i == 0 && count == 0) {
            out << Terminal::DIM << "  "
                << (list.loaded ? "No packages." : "Nothing loaded yet.") << Terminal::RESET;
        }
        out << "\033[K";

        // Scrollbar column
        goto_row(out, row, cols - 1);
        int pos = static_cast<int>(i);
        if (count > rows && pos >= thumb_start && pos < thumb_start + thumb_size) {
            out << Terminal::CYAN << "█" << Terminal::RESET;
        } else {
            out << Terminal::GRAY << "│" << Terminal::RESET;
        }
    }
}

void Renderer::draw_status_bar(std::ostringstream& out, const AppState& state, int cols,
                               const Layout& layout) {
    goto_row(out, layout.status_bar.y);

    std::string prefix = has_active_operation(state) ? std::string(spinner()) + " " : "  ";
    std::string hint = "?: help  q: quit ";
    int hint_width = static_cast<int>(display_width(hint));
    int text_width = std::max(0, cols - hint_width - 2);

    const std::string& status = state.status;
    if (status.rfind("Error", 0) == 0 || status.find("failed") != std::string::npos ||
        status.find("already running") != std::string::npos) {
        out << Terminal::RED;
    } else if (status.find("found") != std::string::npos ||
               status.find("done") != std::string::npos) {
        out << Terminal::GREEN;
    } else if (has_active_operation(state)) {
        out << Terminal::YELLOW;
    } else {
        out << Terminal::DIM;
    }
    out << prefix << fit_width(status, static_cast<size_t>(text_width)) << Terminal::RESET;
    out << Terminal::DIM << hint << Terminal::RESET << "\033[K";
}

void Renderer::draw_help(std::ostringstream& out, int rows, int cols) {
    std::vector<std::string> lines = {
        "Tab / S-Tab   next / previous view",
        "1 2 3         Search / Installed / Upgrades",
        "Up/k Down/j   move selection",
        "PgUp PgDn     move by page",
        "Home End      first / last package",
        "/ or s        search",
        "f             cycle source filter",
        "r             refresh view",
        "i x u         install / uninstall / upgrade",
        "Enter or d    package details",
        "c             clear finished operations",
        "?             close help",
        "q             quit",
    };
    draw_box(out, "Help", lines, rows, cols);
}

void Renderer::draw_detail(std::ostringstream& out, const AppState& state, const std::string& id,
                           int rows, int cols) {
    std::vector<std::string> lines;

    if (id.empty()) {
        lines.push_back("No package selected.");
        draw_box(out, "Details", lines, rows, cols);
        return;
    }

    const PackageDetails* details = nullptr;
    auto cached = state.detail_cache.find(id);
    if (cached != state.detail_cache.end()) {
        details = &cached->second;
    } else {
        const Package* pkg = selected_package(state);
        if (pkg != nullptr && pkg->id == id && pkg->details) {
            details = &*pkg->details;
        }
    }

    if (details != nullptr) {
        lines.push_back("Name:        " + details->name);
        lines.push_back("Id:          " + details->id);
        lines.push_back("Version:     " + details->version);
        lines.push_back("Publisher:   " + details->publisher);
        lines.push_back("Source:      " + details->source);
        lines.push_back("License:     " + details->license);
        lines.push_back("Homepage:    " + details->homepage);
        lines.push_back("");

        // Word-wrap the description to the box
        size_t wrap = static_cast<size_t>(std::max(20, cols - 12));
        std::istringstream words(details->description);
        std::string word;
        std::string line;
        while (words >> word) {
            if (!line.empty() && display_width(line) + 1 + display_width(word) > wrap) {
                lines.push_back(line);
                line.clear();
            }
            if (!line.empty()) line += ' ';
            line += word;
        }
        if (!line.empty()) lines.push_back(line);
    } else {
        auto op = state.operations.find(OperationKey{id, OperationKind::Details});
        if (op != state.operations.end() && op->second.status == OperationStatus::Failed) {
            lines.push_back("Could not load details: " + op->second.message);
        } else {
            lines.push_back(std::string(spinner()) + " Loading details for " + id + "...");
        }
    }

    draw_box(out, "Details", lines, rows, cols);
}

void Renderer::draw_confirm(std::ostringstream& out, const OperationKey& key, int rows, int cols) {
    std::string verb = kind_name(key.kind);
    if (!verb.empty()) verb[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(verb[0])));
    draw_box(out, "Confirm", {verb + " " + key.package_id + "?", "", "y: yes   n: no"}, rows, cols);
}

void Renderer::draw_box(std::ostringstream& out, const std::string& title,
                        const std::vector<std::string>& lines, int rows, int cols) {
    size_t longest = display_width(title) + 4;
    for (const auto& line : lines) {
        longest = std::max(longest, display_width(line));
    }

    int inner = std::min(static_cast<int>(longest) + 2, std::max(10, cols - 4));
    int height = std::min(static_cast<int>(lines.size()) + 2, std::max(3, rows - 2));
    int left = std::max(0, (cols - inner - 2) / 2);
    int top = std::max(0, (rows - height) / 2);

    std::string border;
    for (int i = 0; i < inner; ++i) border += "─";

    goto_row(out, top, left);
    std::string heading = "─ " + title + " ";
    std::string rest;
    for (int i = static_cast<int>(display_width(heading)); i < inner; ++i) rest += "─";
    out << Terminal::CYAN << "┌" << heading << rest << "┐" << Terminal::RESET;

    for (int i = 0; i < height - 2; ++i) {
        goto_row(out, top + 1 + i, left);
        out << Terminal::CYAN << "│" << Terminal::RESET << " "
            << fit_width(lines[static_cast<size_t>(i)], static_cast<size_t>(inner - 2)) << " "
            << Terminal::CYAN << "│" << Terminal::RESET;
    }

    goto_row(out, top + height - 1, left);
    out << Terminal::CYAN << "└" << border << "┘" << Terminal::RESET;
}

std::string Renderer::operation_marker(const AppState& state, const std::string& package_id) const {
    const Operation* op = latest_operation(state, package_id);
    if (op == nullptr || !is_package_action(op->key.kind)) {
        return "";
    }

    switch (op->status) {
        case OperationStatus::Pending:
            return "queued " + kind_name(op->key.kind);
        case OperationStatus::Running:
            return std::string(spinner()) + " " + kind_name(op->key.kind);
        case OperationStatus::Succeeded:
            return "✓ " + kind_name(op->key.kind);
        case OperationStatus::Failed:
            return "✗ " + kind_name(op->key.kind) + " failed";
    }
    return "";
}

const char* Renderer::spinner() const {
    static constexpr const char* FRAMES[] = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
    return FRAMES[tick_ % (sizeof(FRAMES) / sizeof(FRAMES[0]))];
}

} // namespace pkgdash
