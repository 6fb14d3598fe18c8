#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace llmchat {

/**
 * Source of user input lines.
 *
 * The chat loop, the command layer and the @file confirmation all read
 * through this interface so tests can script the user's answers.
 */
class LineInput {
public:
    virtual ~LineInput() = default;

    // Reads one line after showing the prompt. Returns nullopt at end of input.
    virtual std::optional<std::string> read_line(const std::string& prompt) = 0;

    // Like read_line, but typed characters are echoed as '*'.
    virtual std::optional<std::string> read_secret(const std::string& prompt) = 0;
};

/**
 * Single-line input editor with raw terminal mode.
 *
 * Features:
 * - Backspace that erases whole UTF-8 characters
 * - Ctrl+U clears the line, Ctrl+D on an empty line ends input
 * - Masked echo for secrets
 * - Plain std::getline fallback when stdin is not a terminal
 *
 * Ctrl+C still raises SIGINT; the read is interrupted and an empty line
 * is returned so the caller can check its interrupt flag.
 */
class InputEditor : public LineInput {
public:
    using OutputCallback = std::function<void(const std::string&)>;

    /**
     * Create an input editor.
     * @param output Callback for output (typically writes to stdout)
     * @param colors_enabled Whether to use ANSI colors
     */
    explicit InputEditor(OutputCallback output, bool colors_enabled = true);
    ~InputEditor() override;

    std::optional<std::string> read_line(const std::string& prompt) override;
    std::optional<std::string> read_secret(const std::string& prompt) override;

private:
    OutputCallback output_;
    bool colors_enabled_;

    // Terminal state - using pimpl to avoid including termios.h in header
    struct TerminalState;
    std::unique_ptr<TerminalState> terminal_state_;

    // Enable/disable raw terminal mode
    bool enable_raw_mode();
    void disable_raw_mode();

    int read_key();

    std::optional<std::string> edit_line(const std::string& prompt, bool masked);
    std::optional<std::string> read_plain_line(const std::string& prompt);
    void redraw(const std::string& prompt, const std::string& buffer, bool masked);
};

} // namespace llmchat
