#pragma once

#include <string>

namespace llmchat {
namespace terminal {

/**
 * Get the terminal width in columns.
 * Returns 80 if width cannot be determined.
 */
int get_width();

/**
 * Check if stdout is a TTY (interactive terminal).
 */
bool is_tty();

/**
 * Check if stdin is a TTY. Line editing needs this; piped input is
 * read line by line instead.
 */
bool is_stdin_tty();

/**
 * Calculate the display width of a string, accounting for
 * ANSI escape sequences (which have zero width) and
 * multi-byte UTF-8 characters.
 *
 * @param text The text to measure
 * @return Display width in columns
 */
int display_width(const std::string& text);

/**
 * Remove the last UTF-8 code point from a string.
 * Used by backspace handling so multi-byte characters are erased whole.
 */
void pop_utf8_char(std::string& text);

namespace clear {
    /**
     * Clear from cursor to end of line.
     * ANSI: \033[K
     */
    std::string to_end_of_line();
}

} // namespace terminal
} // namespace llmchat
