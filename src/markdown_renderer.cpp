#include "markdown_renderer.hpp"
#include "terminal.hpp"
#include <cmark.h>
#include <algorithm>
#include <sstream>
#include <vector>

namespace llmchat {

namespace {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* ITALIC = "\033[3m";
    constexpr const char* UNDERLINE = "\033[4m";
    constexpr const char* DIM = "\033[2m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* BLUE = "\033[34m";
    constexpr const char* MAGENTA = "\033[35m";

    // Bullet color per nesting depth.
    constexpr const char* BULLET_COLORS[] = {CYAN, YELLOW, GREEN, MAGENTA, BLUE};

    // Plain text of a node's subtree (inline markup dropped).
    std::string plain_text(cmark_node* node) {
        std::string text;
        cmark_iter* iter = cmark_iter_new(node);
        cmark_event_type ev;

        while ((ev = cmark_iter_next(iter)) != CMARK_EVENT_DONE) {
            if (ev != CMARK_EVENT_ENTER) {
                continue;
            }
            cmark_node* cur = cmark_iter_get_node(iter);
            switch (cmark_node_get_type(cur)) {
                case CMARK_NODE_TEXT:
                case CMARK_NODE_CODE: {
                    const char* literal = cmark_node_get_literal(cur);
                    if (literal) text += literal;
                    break;
                }
                case CMARK_NODE_SOFTBREAK:
                    text += " ";
                    break;
                case CMARK_NODE_LINEBREAK:
                    text += "\n";
                    break;
                default:
                    break;
            }
        }

        cmark_iter_free(iter);
        return text;
    }

    std::string repeat(const std::string& s, size_t n) {
        std::string out;
        out.reserve(s.size() * n);
        for (size_t i = 0; i < n; i++) {
            out += s;
        }
        return out;
    }

    struct ListLevel {
        bool ordered;
        int next_number;
    };
}

MarkdownRenderer::MarkdownRenderer(bool colors_enabled)
    : colors_enabled_(colors_enabled) {
}

std::string MarkdownRenderer::render(const std::string& markdown) const {
    if (markdown.empty()) {
        return "";
    }

    cmark_node* doc = cmark_parse_document(markdown.c_str(), markdown.length(), CMARK_OPT_DEFAULT);
    if (!doc) {
        return markdown.back() == '\n' ? markdown : markdown + "\n";
    }

    std::string out;
    std::vector<ListLevel> lists;
    std::string indent;  // Prefix for block content nested in list items.

    // Separates consecutive top-level blocks with one blank line.
    auto start_block = [&](cmark_node* node) {
        if (cmark_node_parent(node) == doc && cmark_node_previous(node) != nullptr) {
            out += "\n";
        }
    };

    cmark_iter* iter = cmark_iter_new(doc);
    cmark_event_type ev;

    while ((ev = cmark_iter_next(iter)) != CMARK_EVENT_DONE) {
        cmark_node* cur = cmark_iter_get_node(iter);
        const bool entering = (ev == CMARK_EVENT_ENTER);

        switch (cmark_node_get_type(cur)) {
            case CMARK_NODE_HEADING:
                if (entering) {
                    start_block(cur);
                    out += heading(plain_text(cur), cmark_node_get_heading_level(cur));
                    cmark_iter_reset(iter, cur, CMARK_EVENT_EXIT);
                }
                break;

            case CMARK_NODE_PARAGRAPH:
                if (entering) {
                    start_block(cur);
                } else {
                    out += "\n";
                }
                break;

            case CMARK_NODE_TEXT:
                if (entering) {
                    const char* literal = cmark_node_get_literal(cur);
                    if (literal) out += literal;
                }
                break;

            case CMARK_NODE_SOFTBREAK:
                out += " ";
                break;

            case CMARK_NODE_LINEBREAK:
                out += "\n" + indent;
                break;

            case CMARK_NODE_CODE:
                if (entering) {
                    const char* literal = cmark_node_get_literal(cur);
                    out += code(literal ? literal : "");
                }
                break;

            case CMARK_NODE_CODE_BLOCK:
                if (entering) {
                    start_block(cur);
                    const char* info = cmark_node_get_fence_info(cur);
                    const char* literal = cmark_node_get_literal(cur);
                    out += code_block(literal ? literal : "", info ? info : "", indent);
                }
                break;

            case CMARK_NODE_STRONG:
                if (entering) {
                    out += bold(plain_text(cur));
                    cmark_iter_reset(iter, cur, CMARK_EVENT_EXIT);
                }
                break;

            case CMARK_NODE_EMPH:
                if (entering) {
                    out += italic(plain_text(cur));
                    cmark_iter_reset(iter, cur, CMARK_EVENT_EXIT);
                }
                break;

            case CMARK_NODE_LINK:
                if (entering) {
                    const char* url = cmark_node_get_url(cur);
                    out += link(plain_text(cur), url ? url : "");
                    cmark_iter_reset(iter, cur, CMARK_EVENT_EXIT);
                }
                break;

            case CMARK_NODE_IMAGE:
                if (entering) {
                    const char* url = cmark_node_get_url(cur);
                    out += ansi(DIM) + "[image: " + plain_text(cur) + "]" + ansi(RESET);
                    if (url && *url) {
                        out += " " + ansi(UNDERLINE) + ansi(BLUE) + url + ansi(RESET);
                    }
                    cmark_iter_reset(iter, cur, CMARK_EVENT_EXIT);
                }
                break;

            case CMARK_NODE_LIST:
                if (entering) {
                    if (lists.empty()) start_block(cur);
                    lists.push_back({cmark_node_get_list_type(cur) == CMARK_ORDERED_LIST,
                                     cmark_node_get_list_start(cur)});
                } else {
                    lists.pop_back();
                }
                break;

            case CMARK_NODE_ITEM:
                if (entering) {
                    size_t depth = lists.empty() ? 0 : lists.size() - 1;
                    std::string marker_indent = "  " + std::string(depth * 2, ' ');
                    const char* color = BULLET_COLORS[depth % 5];

                    std::string marker = "●";
                    if (!lists.empty() && lists.back().ordered) {
                        marker = std::to_string(lists.back().next_number++) + ".";
                    }
                    out += marker_indent + ansi(color) + marker + ansi(RESET) + " ";
                    indent = marker_indent + "   ";
                } else {
                    indent.clear();
                }
                break;

            case CMARK_NODE_BLOCK_QUOTE:
                if (entering) {
                    start_block(cur);
                    out += blockquote(plain_text(cur));
                    cmark_iter_reset(iter, cur, CMARK_EVENT_EXIT);
                }
                break;

            case CMARK_NODE_THEMATIC_BREAK:
                if (entering) {
                    start_block(cur);
                    out += horizontal_rule();
                }
                break;

            case CMARK_NODE_HTML_BLOCK:
            case CMARK_NODE_HTML_INLINE:
                if (entering) {
                    const char* html = cmark_node_get_literal(cur);
                    if (html) out += ansi(DIM) + html + ansi(RESET);
                }
                break;

            default:
                break;
        }
    }

    cmark_iter_free(iter);
    cmark_node_free(doc);

    if (!out.empty() && out.back() != '\n') {
        out += "\n";
    }
    return out;
}

std::string MarkdownRenderer::ansi(const char* code) const {
    return colors_enabled_ ? code : "";
}

std::string MarkdownRenderer::bold(const std::string& text) const {
    return ansi(BOLD) + text + ansi(RESET);
}

std::string MarkdownRenderer::italic(const std::string& text) const {
    return ansi(ITALIC) + text + ansi(RESET);
}

std::string MarkdownRenderer::code(const std::string& text) const {
    return ansi(CYAN) + "`" + text + "`" + ansi(RESET);
}

std::string MarkdownRenderer::code_block(const std::string& text, const std::string& lang,
                                         const std::string& indent) const {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    size_t widest = 0;
    while (std::getline(stream, line)) {
        widest = std::max(widest, static_cast<size_t>(terminal::display_width(line)));
        lines.push_back(line);
    }

    // Box is at least 40 columns and wide enough for the label.
    const size_t label_width = lang.empty() ? 0 : lang.size() + 3;
    const size_t box_width = std::max({size_t(40), widest + 4, label_width + 10});

    std::string out = indent + ansi(DIM) + "┌";
    size_t top_fill = box_width - 2;
    if (!lang.empty()) {
        out += "─[" + ansi(RESET) + ansi(YELLOW) + lang + ansi(RESET) + ansi(DIM) + "]";
        top_fill -= label_width;
    }
    out += repeat("─", top_fill) + "┐" + ansi(RESET) + "\n";

    for (const auto& l : lines) {
        size_t padding = box_width - 4 - static_cast<size_t>(terminal::display_width(l));
        out += indent + ansi(DIM) + "│" + ansi(RESET) + " " + ansi(GREEN) + l + ansi(RESET) +
               std::string(padding, ' ') + ansi(DIM) + " │" + ansi(RESET) + "\n";
    }

    out += indent + ansi(DIM) + "└" + repeat("─", box_width - 2) + "┘" + ansi(RESET) + "\n";
    return out;
}

std::string MarkdownRenderer::heading(const std::string& text, int level) const {
    const char* color = MAGENTA;
    switch (level) {
        case 1: color = GREEN; break;
        case 2: color = BLUE; break;
        case 3: color = CYAN; break;
        default: break;
    }
    return ansi(BOLD) + ansi(color) + std::string(level, '#') + " " + text + ansi(RESET) + "\n";
}

std::string MarkdownRenderer::link(const std::string& text, const std::string& url) const {
    // OSC 8 hyperlink; terminals without support show the underlined text.
    if (colors_enabled_) {
        return "\033]8;;" + url + "\033\\" +
               ansi(UNDERLINE) + ansi(BLUE) + text + ansi(RESET) +
               "\033]8;;\033\\";
    }
    return text + " <" + url + ">";
}

std::string MarkdownRenderer::blockquote(const std::string& text) const {
    std::string out;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        out += ansi(DIM) + "│ " + ansi(RESET) + ansi(ITALIC) + line + ansi(RESET) + "\n";
    }
    return out;
}

std::string MarkdownRenderer::horizontal_rule() const {
    return ansi(DIM) + repeat("─", 40) + ansi(RESET) + "\n";
}

} // namespace llmchat
