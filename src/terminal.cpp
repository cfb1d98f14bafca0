#include "terminal.hpp"
#include <unistd.h>
#include <sys/ioctl.h>
#include <cstdio>

namespace pkgdash {

Terminal::Terminal() : Terminal(STDIN_FILENO) {
}

Terminal::Terminal(int input_fd) : input_fd_(input_fd) {
    update_size();
}

bool Terminal::read_byte(char& c) {
    return read(input_fd_, &c, 1) == 1;
}

Terminal::~Terminal() {
    if (fullscreen_) {
        leave_fullscreen();
    }
    if (raw_mode_enabled_) {
        restore();
    }
}

bool Terminal::setup_raw_mode() {
    if (raw_mode_enabled_) return true;

    // Save original terminal attributes
    if (tcgetattr(input_fd_, &original_termios_) != 0) {
        return false;
    }

    struct termios raw = original_termios_;

    // Input modes: no break, no CR to NL, no parity check, no strip char,
    // no start/stop output control
    raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);

    // Output modes: disable post processing
    raw.c_oflag &= ~(OPOST);

    // Control modes: set 8 bit chars
    raw.c_cflag |= (CS8);

    // Local modes: no echo, no canonical mode, no extended functions,
    // no signal chars (^Z, ^C)
    raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);

    // Control chars: set return condition (min bytes and timeout)
    raw.c_cc[VMIN] = 0;   // Return immediately with any available bytes
    raw.c_cc[VTIME] = 1;  // 100ms timeout (for non-blocking reads)

    if (tcsetattr(input_fd_, TCSAFLUSH, &raw) != 0) {
        return false;
    }
    raw_mode_enabled_ = true;
    return true;
}

void Terminal::restore() {
    if (!raw_mode_enabled_) return;

    tcsetattr(input_fd_, TCSAFLUSH, &original_termios_);
    raw_mode_enabled_ = false;
    show_cursor();
}

void Terminal::enter_fullscreen() {
    if (fullscreen_) return;
    write("\033[?1049h");              // Alternate screen
    write("\033[?1000h\033[?1002h");   // Button and drag reporting
    write("\033[?1006h");              // SGR coordinates
    fullscreen_ = true;
}

void Terminal::leave_fullscreen() {
    if (!fullscreen_) return;
    write("\033[?1006l\033[?1002l\033[?1000l");
    write("\033[?1049l");
    fullscreen_ = false;
}

void Terminal::clear_screen() {
    write("\033[2J");      // Clear entire screen
    write("\033[H");       // Move cursor to home position
}

void Terminal::hide_cursor() {
    write("\033[?25l");
}

void Terminal::show_cursor() {
    write("\033[?25h");
}

InputEvent Terminal::read_event() {
    int key = read_key();
    if (key == KEY_NONE) {
        return InputEvent{};
    }
    if (key == KEY_MOUSE) {
        return read_mouse();
    }
    return InputEvent::key_event(key);
}

int Terminal::read_key() {
    char c;
    if (!read_byte(c)) {
        return KEY_NONE;
    }

    // Handle escape sequences; a lone ESC is the Escape key
    if (c == '\033') {
        char next;
        if (!read_byte(next)) return KEY_ESCAPE;

        if (next == '[') {
            return read_csi();
        }
        if (next == 'O') {
            // SS3: ESC O H / ESC O F, function keys otherwise
            if (!read_byte(next)) return KEY_UNKNOWN;
            switch (next) {
                case 'H': return KEY_HOME;
                case 'F': return KEY_END;
            }
            return KEY_UNKNOWN;
        }

        // Alt+key
        return KEY_UNKNOWN;
    }

    // Handle backspace (some terminals send 127, some send 8)
    if (c == 127 || c == 8) {
        return KEY_BACKSPACE;
    }

    // Bytes of UTF-8 sequences come through one at a time
    return static_cast<int>(static_cast<unsigned char>(c));
}

// Decode ESC [ <params> <final>, consuming up to the final byte
int Terminal::read_csi() {
    char c;
    if (!read_byte(c)) return KEY_UNKNOWN;

    // SGR mouse report follows: ESC [ < b ; x ; y M
    if (c == '<') return KEY_MOUSE;

    std::string params;
    while (c < 0x40 || c > 0x7E) {
        params += c;
        if (!read_byte(c)) return KEY_UNKNOWN;
    }

    if (params.empty()) {
        switch (c) {
            case 'A': return KEY_UP;
            case 'B': return KEY_DOWN;
            case 'C': return KEY_RIGHT;
            case 'D': return KEY_LEFT;
            case 'H': return KEY_HOME;
            case 'F': return KEY_END;
            case 'Z': return KEY_SHIFT_TAB;
        }
        return KEY_UNKNOWN;
    }

    if (c == '~') {
        if (params == "1" || params == "7") return KEY_HOME;
        if (params == "4" || params == "8") return KEY_END;
        if (params == "3") return KEY_DELETE;
        if (params == "5") return KEY_PAGE_UP;
        if (params == "6") return KEY_PAGE_DOWN;
    }

    // Modified arrows, function keys, Insert
    return KEY_UNKNOWN;
}

InputEvent Terminal::read_mouse() {
    // Remaining bytes: b ; x ; y (M|m)
    int fields[3] = {0, 0, 0};
    int field = 0;
    char c;
    char final_byte = 0;

    while (read_byte(c)) {
        if (c >= '0' && c <= '9') {
            fields[field] = fields[field] * 10 + (c - '0');
        } else if (c == ';') {
            if (++field > 2) return InputEvent{};
        } else if (c == 'M' || c == 'm') {
            final_byte = c;
            break;
        } else {
            return InputEvent{};
        }
    }
    if (final_byte == 0 || field != 2) {
        return InputEvent{};
    }

    int button = fields[0];
    int x = fields[1] - 1;
    int y = fields[2] - 1;

    if (final_byte == 'm') {
        return InputEvent::mouse_event(MouseAction::Release, x, y);
    }
    if (button == 64) return InputEvent::mouse_event(MouseAction::WheelUp, x, y);
    if (button == 65) return InputEvent::mouse_event(MouseAction::WheelDown, x, y);
    if (button == 32) return InputEvent::mouse_event(MouseAction::LeftDrag, x, y);
    if (button == 0) return InputEvent::mouse_event(MouseAction::LeftDown, x, y);
    if (button == 2) return InputEvent::mouse_event(MouseAction::RightDown, x, y);

    return InputEvent{};
}

void Terminal::write(const std::string& text) {
    size_t written = 0;
    while (written < text.size()) {
        ssize_t n = ::write(STDOUT_FILENO, text.c_str() + written, text.size() - written);
        if (n <= 0) break;
        written += static_cast<size_t>(n);
    }
}

void Terminal::flush() {
    fflush(stdout);
}

void Terminal::update_size() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0) {
        rows_ = ws.ws_row;
        cols_ = ws.ws_col;
    }
}

} // namespace pkgdash
