#pragma once

#include <string>
#include <vector>
#include <iostream>

namespace llmchat {

// ========== ANSI Escape Codes ==========

// ANSI escape codes for terminal colors.
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* DIM = "\033[2m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* BLUE = "\033[34m";
    constexpr const char* MAGENTA = "\033[35m";
    constexpr const char* CYAN = "\033[36m";
}

/**
 * Terminal output helper with color support.
 *
 * Provides styled output methods that automatically handle ANSI color codes
 * based on terminal capabilities. Falls back to plain text when colors are
 * not supported (e.g., when TERM=dumb or output is not a TTY).
 */
class Console {
public:
    // Creates a Console writing to stdout and detects color support.
    Console();

    // Creates a Console writing to the given stream (tests use a stringstream).
    Console(std::ostream& out, bool colors_enabled);

    bool colors_enabled() const { return colors_enabled_; }

    // ========== Basic Output ==========

    // Prints text without a trailing newline.
    void print(const std::string& text) const;

    // Prints text followed by a newline.
    void println(const std::string& text = "") const;

    // ========== Colored Output ==========

    // Prints error message in red.
    void print_error(const std::string& text) const;

    // Prints warning message in yellow.
    void print_warning(const std::string& text) const;

    // Prints success message in green with a checkmark prefix.
    void print_success(const std::string& text) const;

    // Prints informational message in cyan.
    void print_info(const std::string& text) const;

    // Prints header text in bold cyan.
    void print_header(const std::string& text) const;

    // Prints dimmed secondary text followed by a newline.
    void print_dim(const std::string& text) const;

    // Prints text with a specific ANSI color code.
    void print_colored(const std::string& text, const char* color) const;

    // ========== Structured Output ==========

    // Prints a titled table with one column per header, columns padded
    // to their widest cell.
    void print_table(const std::string& title,
                     const std::vector<std::string>& headers,
                     const std::vector<std::vector<std::string>>& rows) const;

    // Prints text inside a box with the title in the top border.
    void print_panel(const std::string& title, const std::string& body) const;

    // ========== Status Messages ==========

    // Displays a status message (for progress indication).
    void start_status(const std::string& message) const;

    // Clears the current status line.
    void clear_status() const;

    // ========== Raw Output ==========

    // Prints text without newline or formatting (for streaming output).
    void print_raw(const std::string& text) const;

    // Flushes the output stream.
    void flush() const;

private:
    std::ostream& out_;
    bool colors_enabled_;  // True if terminal supports ANSI colors.

    // Detects and enables color support based on terminal capabilities.
    void enable_colors();
};

} // namespace llmchat
