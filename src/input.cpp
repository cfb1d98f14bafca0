#include "input.hpp"
#include <algorithm>
#include <cmath>

namespace pkgdash {

namespace {

constexpr int WHEEL_STEP = 3;
constexpr int DEFAULT_PAGE = 20;

KeyCommand command(CommandType type, int amount = 0) {
    KeyCommand cmd;
    cmd.type = type;
    cmd.amount = amount;
    return cmd;
}

KeyCommand view_command(View view) {
    KeyCommand cmd;
    cmd.type = CommandType::SwitchView;
    cmd.view = view;
    return cmd;
}

int page_size(const InputContext& ctx) {
    return ctx.layout.list_rows > 0 ? ctx.layout.list_rows : DEFAULT_PAGE;
}

// Map a row on the scrollbar track to a visible index
KeyCommand scrollbar_jump(const InputContext& ctx, int row) {
    const Rect& track = ctx.layout.scrollbar;
    if (track.height <= 0 || ctx.visible_count == 0) {
        return KeyCommand{};
    }
    int clamped = std::clamp(row, track.y, track.y + track.height - 1);
    double ratio = static_cast<double>(clamped - track.y) / std::max(1, track.height - 1);
    int index = static_cast<int>(std::lround(ratio * static_cast<double>(ctx.visible_count - 1)));
    return command(CommandType::Select, index);
}

KeyCommand map_search_key(int key) {
    switch (key) {
        case Terminal::KEY_ESCAPE:
            return command(CommandType::CancelSearch);
        case Terminal::KEY_ENTER:
            return command(CommandType::SubmitSearch);
        case Terminal::KEY_BACKSPACE:
            return command(CommandType::SearchBackspace);
        default:
            break;
    }

    // Printable ASCII and UTF-8 bytes
    if ((key >= 32 && key < 127) || (key >= 128 && key < 256)) {
        KeyCommand cmd = command(CommandType::SearchInput);
        cmd.text = std::string(1, static_cast<char>(key));
        return cmd;
    }
    return KeyCommand{};
}

KeyCommand map_normal_key(int key, const InputContext& ctx) {
    switch (key) {
        case 'q':
        case Terminal::KEY_ESCAPE:
            return command(CommandType::Quit);
        case '?':
            return command(CommandType::ToggleHelp);
        case Terminal::KEY_TAB:
            return command(CommandType::NextView);
        case Terminal::KEY_SHIFT_TAB:
            return command(CommandType::PreviousView);
        case '1':
            return view_command(View::Search);
        case '2':
            return view_command(View::Installed);
        case '3':
            return view_command(View::Upgrades);

        // Navigation
        case Terminal::KEY_UP:
        case 'k':
            return command(CommandType::MoveUp);
        case Terminal::KEY_DOWN:
        case 'j':
            return command(CommandType::MoveDown);
        case Terminal::KEY_PAGE_UP:
            return command(CommandType::PageUp, page_size(ctx));
        case Terminal::KEY_PAGE_DOWN:
            return command(CommandType::PageDown, page_size(ctx));
        case Terminal::KEY_HOME:
            return command(CommandType::Home);
        case Terminal::KEY_END:
            return command(CommandType::End);

        case '/':
        case 's':
            return command(CommandType::FocusSearch);
        case 'f':
            return command(CommandType::CycleFilter);
        case 'r':
            return command(CommandType::Refresh);

        case 'i':
            return command(CommandType::Install);
        case 'x':
            return command(CommandType::Uninstall);
        case 'u':
            return command(CommandType::Upgrade);

        case Terminal::KEY_ENTER:
        case 'd':
            return command(CommandType::ToggleDetail);
        case 'c':
            return command(CommandType::ClearFinished);

        default:
            return KeyCommand{};
    }
}

KeyCommand map_key(int key, const InputContext& ctx) {
    if (key == Terminal::KEY_CTRL_C) {
        return command(CommandType::Quit);
    }

    switch (ctx.overlay) {
        case OverlayKind::Confirm:
            if (key == 'y' || key == 'Y') return command(CommandType::Confirm);
            if (key == 'n' || key == 'N' || key == Terminal::KEY_ESCAPE) {
                return command(CommandType::Cancel);
            }
            return KeyCommand{};

        case OverlayKind::Help:
            if (key == '?' || key == Terminal::KEY_ESCAPE) {
                return command(CommandType::CloseOverlay);
            }
            return KeyCommand{};

        case OverlayKind::Detail:
            // Navigation keeps working so details follow the selection
            if (key == Terminal::KEY_ESCAPE) {
                return command(CommandType::CloseOverlay);
            }
            break;

        case OverlayKind::None:
            break;
    }

    if (ctx.mode == InputMode::Search) {
        return map_search_key(key);
    }
    return map_normal_key(key, ctx);
}

KeyCommand map_mouse(const InputEvent& event, const InputContext& ctx) {
    const Layout& layout = ctx.layout;
    int col = event.x;
    int row = event.y;

    switch (event.mouse) {
        case MouseAction::LeftDown: {
            // Dismiss dialogs/help on any click
            if (ctx.overlay == OverlayKind::Confirm) {
                return command(CommandType::Cancel);
            }
            if (ctx.overlay != OverlayKind::None) {
                return command(CommandType::CloseOverlay);
            }

            if (layout.tab_bar.contains(col, row)) {
                for (const auto& tab : layout.tabs) {
                    if (col >= tab.start && col < tab.end) {
                        return view_command(tab.view);
                    }
                }
                return KeyCommand{};
            }

            // Search bar first since it shares a row with the filter
            if (layout.search_bar.contains(col, row)) {
                return command(CommandType::FocusSearch);
            }
            if (layout.filter_bar.contains(col, row)) {
                return command(CommandType::CycleFilter);
            }

            if (layout.package_list.contains(col, row)) {
                if (layout.scrollbar.contains(col, row)) {
                    return scrollbar_jump(ctx, row);
                }
                if (row >= layout.list_content_y) {
                    size_t index = layout.first_index + static_cast<size_t>(row - layout.list_content_y);
                    if (index < ctx.visible_count) {
                        return command(CommandType::Select, static_cast<int>(index));
                    }
                }
            }
            return KeyCommand{};
        }

        case MouseAction::LeftDrag:
            if (ctx.overlay == OverlayKind::None && layout.scrollbar.contains(col, row)) {
                return scrollbar_jump(ctx, row);
            }
            return KeyCommand{};

        case MouseAction::RightDown:
            // Right-click selects the row under the pointer
            if (ctx.overlay == OverlayKind::None && layout.package_list.contains(col, row) &&
                row >= layout.list_content_y) {
                size_t index = layout.first_index + static_cast<size_t>(row - layout.list_content_y);
                if (index < ctx.visible_count) {
                    return command(CommandType::Select, static_cast<int>(index));
                }
            }
            return KeyCommand{};

        case MouseAction::WheelUp:
            if (layout.package_list.contains(col, row)) {
                return command(CommandType::Scroll, -WHEEL_STEP);
            }
            return KeyCommand{};

        case MouseAction::WheelDown:
            if (layout.package_list.contains(col, row)) {
                return command(CommandType::Scroll, WHEEL_STEP);
            }
            return KeyCommand{};

        case MouseAction::Release:
        case MouseAction::None:
            break;
    }

    return KeyCommand{};
}

} // anonymous namespace

InputContext make_input_context(const AppState& state, const Layout& layout) {
    InputContext ctx;
    ctx.mode = state.input_mode;
    ctx.visible_count = state.current().visible.size();
    ctx.layout = layout;

    if (std::holds_alternative<HelpOverlay>(state.overlay)) {
        ctx.overlay = OverlayKind::Help;
    } else if (std::holds_alternative<DetailOverlay>(state.overlay)) {
        ctx.overlay = OverlayKind::Detail;
    } else if (std::holds_alternative<ConfirmOverlay>(state.overlay)) {
        ctx.overlay = OverlayKind::Confirm;
    }
    return ctx;
}

KeyCommand map_input(const InputEvent& event, const InputContext& ctx) {
    switch (event.type) {
        case InputEvent::Type::Key:
            return map_key(event.key, ctx);
        case InputEvent::Type::Mouse:
            return map_mouse(event, ctx);
        case InputEvent::Type::None:
            break;
    }
    return KeyCommand{};
}

} // namespace pkgdash
