#include "terminal.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <cstdlib>

namespace llmchat {
namespace terminal {

int get_width() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }

    // Try COLUMNS environment variable
    const char* columns = std::getenv("COLUMNS");
    if (columns) {
        int width = std::atoi(columns);
        if (width > 0) {
            return width;
        }
    }

    return 80;
}

bool is_tty() {
    return isatty(STDOUT_FILENO) != 0;
}

bool is_stdin_tty() {
    return isatty(STDIN_FILENO) != 0;
}

int display_width(const std::string& text) {
    int width = 0;
    bool in_escape = false;
    size_t i = 0;

    while (i < text.length()) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        // ANSI escape sequences have zero width
        if (c == '\033') {
            in_escape = true;
            i++;
            continue;
        }

        if (in_escape) {
            if (c == 'm' || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '\007') {
                in_escape = false;
            }
            i++;
            continue;
        }

        // Each code point counts as one column; continuation bytes are skipped.
        if ((c & 0x80) == 0) {
            if (c != '\n' && c != '\r') {
                width++;
            }
        } else if ((c & 0xE0) == 0xC0) {
            width++;
            i += 1;
        } else if ((c & 0xF0) == 0xE0) {
            width++;
            i += 2;
        } else if ((c & 0xF8) == 0xF0) {
            width++;
            i += 3;
        }

        i++;
    }

    return width;
}

void pop_utf8_char(std::string& text) {
    if (text.empty()) {
        return;
    }
    size_t pos = text.size() - 1;
    // Step back over continuation bytes (10xxxxxx).
    while (pos > 0 && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
        pos--;
    }
    text.erase(pos);
}

namespace clear {

std::string to_end_of_line() {
    return "\033[K";
}

} // namespace clear

} // namespace terminal
} // namespace llmchat
