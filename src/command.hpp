#pragma once

#include "operation.hpp"
#include <string>

namespace pkgdash {

enum class CommandType {
    None,
    Quit,

    // Navigation
    MoveUp,
    MoveDown,
    Scroll,        // amount rows, negative is up
    PageUp,        // amount = page size
    PageDown,
    Home,
    End,
    Select,        // amount = visible index

    // Views and filter
    SwitchView,
    NextView,
    PreviousView,
    CycleFilter,

    // Search bar
    FocusSearch,
    SearchInput,   // text = bytes to append
    SearchBackspace,
    SubmitSearch,
    CancelSearch,

    // Package actions
    Install,
    Uninstall,
    Upgrade,
    Refresh,

    // Overlays
    ToggleHelp,
    ToggleDetail,
    CloseOverlay,
    Confirm,
    Cancel,

    ClearFinished,
};

struct KeyCommand {
    CommandType type = CommandType::None;
    int amount = 0;
    View view = View::Installed;
    std::string text;
};

} // namespace pkgdash
