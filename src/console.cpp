#include "console.hpp"
#include "terminal.hpp"
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace llmchat {

namespace {
    std::string repeat(const std::string& s, size_t n) {
        std::string out;
        out.reserve(s.size() * n);
        for (size_t i = 0; i < n; i++) {
            out += s;
        }
        return out;
    }

    std::string pad_right(const std::string& text, size_t width) {
        size_t shown = static_cast<size_t>(terminal::display_width(text));
        return shown >= width ? text : text + std::string(width - shown, ' ');
    }
}

Console::Console() : out_(std::cout), colors_enabled_(true) {
    enable_colors();
}

Console::Console(std::ostream& out, bool colors_enabled)
    : out_(out), colors_enabled_(colors_enabled) {
}

void Console::enable_colors() {
    // Colors only when writing to a real terminal that understands them
    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb" || !terminal::is_tty()) {
        colors_enabled_ = false;
    }
}

void Console::print(const std::string& text) const {
    out_ << text;
}

void Console::println(const std::string& text) const {
    out_ << text << std::endl;
}

void Console::print_error(const std::string& text) const {
    if (colors_enabled_) {
        out_ << ansi::RED << text << ansi::RESET << std::endl;
    } else {
        out_ << text << std::endl;
    }
}

void Console::print_warning(const std::string& text) const {
    if (colors_enabled_) {
        out_ << ansi::YELLOW << text << ansi::RESET << std::endl;
    } else {
        out_ << text << std::endl;
    }
}

void Console::print_success(const std::string& text) const {
    if (colors_enabled_) {
        out_ << ansi::GREEN << "✓" << ansi::RESET << " " << text << std::endl;
    } else {
        out_ << "* " << text << std::endl;
    }
}

void Console::print_info(const std::string& text) const {
    if (colors_enabled_) {
        out_ << ansi::CYAN << text << ansi::RESET << std::endl;
    } else {
        out_ << text << std::endl;
    }
}

void Console::print_header(const std::string& text) const {
    if (colors_enabled_) {
        out_ << ansi::BOLD << ansi::CYAN << text << ansi::RESET << std::endl;
    } else {
        out_ << text << std::endl;
    }
}

void Console::print_dim(const std::string& text) const {
    if (colors_enabled_) {
        out_ << ansi::DIM << text << ansi::RESET << std::endl;
    } else {
        out_ << text << std::endl;
    }
}

void Console::print_colored(const std::string& text, const char* color) const {
    if (colors_enabled_) {
        out_ << color << text << ansi::RESET;
    } else {
        out_ << text;
    }
}

void Console::print_table(const std::string& title,
                          const std::vector<std::string>& headers,
                          const std::vector<std::vector<std::string>>& rows) const {
    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); c++) {
        widths[c] = static_cast<size_t>(terminal::display_width(headers[c]));
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < row.size() && c < widths.size(); c++) {
            widths[c] = std::max(widths[c], static_cast<size_t>(terminal::display_width(row[c])));
        }
    }

    size_t total = 0;
    for (size_t w : widths) total += w + 2;

    print_header(title);

    std::string header_line;
    for (size_t c = 0; c < headers.size(); c++) {
        header_line += pad_right(headers[c], widths[c] + 2);
    }
    if (colors_enabled_) {
        out_ << ansi::BOLD << header_line << ansi::RESET << std::endl;
    } else {
        out_ << header_line << std::endl;
    }
    print_dim(repeat("─", total));

    for (const auto& row : rows) {
        std::string line;
        for (size_t c = 0; c < widths.size(); c++) {
            line += pad_right(c < row.size() ? row[c] : "", widths[c] + 2);
        }
        out_ << line << std::endl;
    }
}

void Console::print_panel(const std::string& title, const std::string& body) const {
    std::vector<std::string> lines;
    std::istringstream stream(body);
    std::string line;
    size_t widest = static_cast<size_t>(terminal::display_width(title)) + 4;
    while (std::getline(stream, line)) {
        widest = std::max(widest, static_cast<size_t>(terminal::display_width(line)));
        lines.push_back(line);
    }

    // Long lines are not wrapped; the box grows up to the terminal width.
    size_t max_inner = static_cast<size_t>(std::max(20, terminal::get_width() - 4));
    size_t inner = std::min(widest, max_inner);

    const char* border = colors_enabled_ ? ansi::BLUE : "";
    const char* reset = colors_enabled_ ? ansi::RESET : "";

    size_t title_width = static_cast<size_t>(terminal::display_width(title));
    size_t fill = inner + 2 > title_width + 3 ? inner + 2 - title_width - 3 : 0;
    out_ << border << "╭─ " << reset << title << border << " " << repeat("─", fill) << "╮"
         << reset << std::endl;

    for (const auto& l : lines) {
        size_t shown = static_cast<size_t>(terminal::display_width(l));
        out_ << border << "│" << reset << " " << l
             << std::string(shown < inner ? inner - shown : 0, ' ')
             << " " << border << "│" << reset << std::endl;
    }

    out_ << border << "╰" << repeat("─", inner + 2) << "╯" << reset << std::endl;
}

void Console::start_status(const std::string& message) const {
    if (colors_enabled_) {
        // Return to start of line, print message, clear to end of line
        out_ << "\r" << ansi::YELLOW << message << ansi::RESET << "\033[K" << std::flush;
    } else {
        out_ << message << std::endl;
    }
}

void Console::clear_status() const {
    if (colors_enabled_) {
        // Move to beginning of line and clear it
        out_ << "\r\033[K" << std::flush;
    }
    // On dumb terminals, nothing to clear (each status was on its own line)
}

void Console::print_raw(const std::string& text) const {
    out_ << text;
}

void Console::flush() const {
    out_ << std::flush;
}

} // namespace llmchat
