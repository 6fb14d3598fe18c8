#pragma once

#include <string>

namespace llmchat {

/**
 * Renders a complete CommonMark document as ANSI-formatted terminal text.
 *
 * Used for replies that arrive in one piece (non-streaming mode) and for
 * /history. Streamed replies are printed raw as fragments arrive.
 *
 * Usage:
 *   MarkdownRenderer renderer(console.colors_enabled());
 *   std::cout << renderer.render(reply);
 */
class MarkdownRenderer {
public:
    explicit MarkdownRenderer(bool colors_enabled = true);

    // Parses the document with cmark and returns the formatted text.
    // Output always ends with a newline unless the input is empty.
    std::string render(const std::string& markdown) const;

private:
    bool colors_enabled_;

    std::string ansi(const char* code) const;
    std::string bold(const std::string& text) const;
    std::string italic(const std::string& text) const;
    std::string code(const std::string& text) const;
    std::string code_block(const std::string& text, const std::string& lang,
                           const std::string& indent) const;
    std::string heading(const std::string& text, int level) const;
    std::string link(const std::string& text, const std::string& url) const;
    std::string blockquote(const std::string& text) const;
    std::string horizontal_rule() const;
};

} // namespace llmchat
