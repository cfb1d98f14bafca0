#pragma once

#include "command.hpp"
#include "layout.hpp"
#include "state.hpp"
#include "terminal.hpp"

namespace pkgdash {

enum class OverlayKind {
    None,
    Help,
    Detail,
    Confirm,
};

// What the key mapping needs to know about the current frame
struct InputContext {
    InputMode mode = InputMode::Normal;
    OverlayKind overlay = OverlayKind::None;
    size_t visible_count = 0;
    Layout layout;
};

InputContext make_input_context(const AppState& state, const Layout& layout);

// Pure mapping from an input event to a command; unknown input maps to None
KeyCommand map_input(const InputEvent& event, const InputContext& ctx);

} // namespace pkgdash
