#include "input_editor.hpp"
#include "terminal.hpp"

#include <unistd.h>
#include <termios.h>
#include <cerrno>
#include <iostream>

namespace llmchat {

namespace {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* CYAN = "\033[36m";

    // Special key codes
    constexpr int KEY_INTERRUPTED = -2;
    constexpr int KEY_ERROR = -1;
    constexpr int KEY_NONE = 0;
    constexpr int KEY_CTRL_D = 4;
    constexpr int KEY_CTRL_H = 8;
    constexpr int KEY_LINE_FEED = 10;
    constexpr int KEY_ENTER = 13;
    constexpr int KEY_CTRL_U = 21;
    constexpr int KEY_ESCAPE = 27;
    constexpr int KEY_BACKSPACE = 127;

    bool is_continuation_byte(char c) {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }
}

// Pimpl for terminal state
struct InputEditor::TerminalState {
    struct termios original_termios;
    bool raw_mode_enabled = false;
};

InputEditor::InputEditor(OutputCallback output, bool colors_enabled)
    : output_(std::move(output))
    , colors_enabled_(colors_enabled)
    , terminal_state_(std::make_unique<TerminalState>())
{
}

InputEditor::~InputEditor() {
    disable_raw_mode();
}

bool InputEditor::enable_raw_mode() {
    if (terminal_state_->raw_mode_enabled) {
        return true;
    }

    if (tcgetattr(STDIN_FILENO, &terminal_state_->original_termios) == -1) {
        return false;
    }

    struct termios raw = terminal_state_->original_termios;

    // Input modes: no break, no CR to NL, no parity check, no strip char,
    // no start/stop output control
    raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);

    // Output modes: disable post processing (we handle newlines ourselves)
    raw.c_oflag &= ~(OPOST);

    // Control modes: set 8 bit chars
    raw.c_cflag |= (CS8);

    // Local modes: echo off, canonical off, no extended functions.
    // ISIG stays on so Ctrl+C reaches the SIGINT handler.
    raw.c_lflag &= ~(ECHO | ICANON | IEXTEN);

    // Block until at least one byte is available.
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;

    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == -1) {
        return false;
    }

    terminal_state_->raw_mode_enabled = true;
    return true;
}

void InputEditor::disable_raw_mode() {
    if (terminal_state_ && terminal_state_->raw_mode_enabled) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &terminal_state_->original_termios);
        terminal_state_->raw_mode_enabled = false;
    }
}

int InputEditor::read_key() {
    char c;
    ssize_t nread = read(STDIN_FILENO, &c, 1);

    if (nread == -1) {
        return errno == EINTR ? KEY_INTERRUPTED : KEY_ERROR;
    }
    if (nread == 0) {
        return KEY_CTRL_D;  // End of file on the terminal
    }

    // Swallow escape sequences (arrow keys, etc.)
    if (c == KEY_ESCAPE) {
        char seq[2];
        if (read(STDIN_FILENO, &seq[0], 1) != 1) return KEY_NONE;
        if (read(STDIN_FILENO, &seq[1], 1) != 1) return KEY_NONE;
        return KEY_NONE;
    }

    return static_cast<unsigned char>(c);
}

void InputEditor::redraw(const std::string& prompt, const std::string& buffer, bool masked) {
    output_("\r");
    output_(terminal::clear::to_end_of_line());
    output_(colors_enabled_ ? std::string(CYAN) + prompt + RESET : prompt);
    if (masked) {
        output_(std::string(static_cast<size_t>(terminal::display_width(buffer)), '*'));
    } else {
        output_(buffer);
    }
}

std::optional<std::string> InputEditor::read_plain_line(const std::string& prompt) {
    output_(prompt);
    std::string line;
    if (!std::getline(std::cin, line)) {
        if (std::cin.eof() || std::cin.bad()) {
            return std::nullopt;
        }
        // Read interrupted by a signal; the stream is still usable.
        std::cin.clear();
        output_("\n");
        return std::string();
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::optional<std::string> InputEditor::edit_line(const std::string& prompt, bool masked) {
    if (!terminal::is_stdin_tty() || !enable_raw_mode()) {
        return read_plain_line(prompt);
    }

    std::string buffer;
    redraw(prompt, buffer, masked);

    while (true) {
        int key = read_key();

        if (key == KEY_INTERRUPTED) {
            // Ctrl+C: abandon the line, the caller reports the interrupt.
            disable_raw_mode();
            output_("\r\n");
            return std::string();
        }

        if (key == KEY_ERROR) {
            disable_raw_mode();
            output_("\r\n");
            return std::nullopt;
        }

        if (key == KEY_NONE) {
            continue;
        }

        if (key == KEY_CTRL_D) {
            if (buffer.empty()) {
                disable_raw_mode();
                output_("\r\n");
                return std::nullopt;
            }
            continue;
        }

        if (key == KEY_ENTER || key == KEY_LINE_FEED) {
            break;
        }

        if (key == KEY_BACKSPACE || key == KEY_CTRL_H) {
            terminal::pop_utf8_char(buffer);
            redraw(prompt, buffer, masked);
        } else if (key == KEY_CTRL_U) {
            buffer.clear();
            redraw(prompt, buffer, masked);
        } else if (key >= 32) {
            char c = static_cast<char>(key);
            buffer += c;
            if (!masked) {
                output_(std::string(1, c));
            } else if (!is_continuation_byte(c)) {
                output_("*");
            }
        }
        // Other control keys are ignored
    }

    disable_raw_mode();
    output_("\r\n");
    return buffer;
}

std::optional<std::string> InputEditor::read_line(const std::string& prompt) {
    return edit_line(prompt, false);
}

std::optional<std::string> InputEditor::read_secret(const std::string& prompt) {
    return edit_line(prompt, true);
}

} // namespace llmchat
