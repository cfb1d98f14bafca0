#pragma once

#include <string>
#include <termios.h>

namespace pkgdash {

enum class MouseAction {
    None,
    LeftDown,
    RightDown,
    LeftDrag,
    Release,
    WheelUp,
    WheelDown,
};

// One key press or mouse event; coordinates are zero-based cells
struct InputEvent {
    enum class Type {
        None,
        Key,
        Mouse,
    };

    Type type = Type::None;
    int key = 0;
    MouseAction mouse = MouseAction::None;
    int x = 0;
    int y = 0;

    static InputEvent key_event(int key) {
        InputEvent ev;
        ev.type = Type::Key;
        ev.key = key;
        return ev;
    }

    static InputEvent mouse_event(MouseAction action, int x, int y) {
        InputEvent ev;
        ev.type = Type::Mouse;
        ev.mouse = action;
        ev.x = x;
        ev.y = y;
        return ev;
    }
};

class Terminal {
public:
    Terminal();

    // Read input from another descriptor, e.g. a pipe
    explicit Terminal(int input_fd);
    ~Terminal();

    // Disable copy
    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    // Setup/restore terminal state; setup fails when stdin is not a terminal
    bool setup_raw_mode();
    void restore();

    // Alternate screen with mouse reporting
    void enter_fullscreen();
    void leave_fullscreen();

    // Screen operations
    void clear_screen();
    void hide_cursor();
    void show_cursor();

    // Input handling (returns after at most ~100ms)
    InputEvent read_event();

    // Output helpers
    void write(const std::string& text);
    void flush();

    // Get terminal dimensions
    int rows() const { return rows_; }
    int cols() const { return cols_; }
    void update_size();

    // ANSI color codes
    static constexpr const char* RESET = "\033[0m";
    static constexpr const char* BOLD = "\033[1m";
    static constexpr const char* DIM = "\033[2m";
    static constexpr const char* REVERSE = "\033[7m";

    static constexpr const char* BLACK = "\033[30m";
    static constexpr const char* RED = "\033[31m";
    static constexpr const char* GREEN = "\033[32m";
    static constexpr const char* YELLOW = "\033[33m";
    static constexpr const char* BLUE = "\033[34m";
    static constexpr const char* MAGENTA = "\033[35m";
    static constexpr const char* CYAN = "\033[36m";
    static constexpr const char* WHITE = "\033[37m";
    static constexpr const char* GRAY = "\033[90m";

    static constexpr const char* BG_CYAN = "\033[46m";
    static constexpr const char* BG_GRAY = "\033[100m";

    // Special key codes
    enum Key {
        KEY_NONE = -1,
        KEY_ENTER = 13,
        KEY_ESCAPE = 27,
        KEY_BACKSPACE = 127,
        KEY_TAB = 9,
        KEY_CTRL_C = 3,
        KEY_UP = 1000,
        KEY_DOWN = 1001,
        KEY_LEFT = 1002,
        KEY_RIGHT = 1003,
        KEY_HOME = 1004,
        KEY_END = 1005,
        KEY_PAGE_UP = 1006,
        KEY_PAGE_DOWN = 1007,
        KEY_DELETE = 1008,
        KEY_SHIFT_TAB = 1009,
        KEY_UNKNOWN = 1010,  // unrecognised escape sequence, fully consumed
        KEY_MOUSE = 1100,  // SGR mouse report prefix, consumed by read_event
    };

private:
    int read_key();
    int read_csi();
    InputEvent read_mouse();
    bool read_byte(char& c);

    int input_fd_;

    struct termios original_termios_;
    bool raw_mode_enabled_ = false;
    bool fullscreen_ = false;
    int rows_ = 24;
    int cols_ = 80;
};

} // namespace pkgdash
