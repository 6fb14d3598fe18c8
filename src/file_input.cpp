#include "file_input.hpp"
#include "config.hpp"
#include "input_editor.hpp"
#include "presenter.hpp"
#include "text_util.hpp"
#include "verbose.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace llmchat {

namespace fs = std::filesystem;

bool is_file_reference(const std::string& line) {
    return !line.empty() && line[0] == '@';
}

std::string file_reference_path(const std::string& line) {
    std::string path = trim(line.substr(1));
    return path.empty() ? std::string(DEFAULT_INPUT_FILE) : path;
}

std::optional<std::string> load_file_message(const std::string& line,
                                             bool confirm_before_send,
                                             LineInput& input,
                                             Presenter& presenter) {
    const std::string path = file_reference_path(line);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        presenter.show_error(ErrorKind::NotFound, "File not found: " + path);
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        presenter.show_error(ErrorKind::PersistenceError, "Error reading file: " + path);
        return std::nullopt;
    }
    std::string raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        presenter.show_error(ErrorKind::PersistenceError, "Error reading file: " + path);
        return std::nullopt;
    }

    std::string content = trim(raw);
    verbose_log("CHAT", "Read " + std::to_string(content.size()) + " byte(s) from " + path);
    if (content.empty()) {
        presenter.show_warning("File is empty: " + path);
        return std::nullopt;
    }

    if (confirm_before_send) {
        presenter.show_file_preview(path, content);
        std::optional<std::string> answer = input.read_line("Send this? (y/n): ");
        std::string reply = answer ? trim(*answer) : std::string();
        reply = to_lower(reply);
        if (reply != "y" && reply != "yes") {
            presenter.show_warning("Cancelled");
            return std::nullopt;
        }
    }

    presenter.show_success("Loaded from " + path);
    return content;
}

} // namespace llmchat
