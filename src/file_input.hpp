#pragma once

/**
 * "@file" message input.
 *
 * A line starting with '@' names a file whose contents become the next
 * message ("@" alone reads input.txt). The contents are previewed and,
 * when confirmation is on, the user must accept before anything is sent.
 */

#include <optional>
#include <string>

namespace llmchat {

class LineInput;
class Presenter;

// True for input lines that reference a file.
bool is_file_reference(const std::string& line);

// Path named by an "@..." line, with the default file for a bare "@".
std::string file_reference_path(const std::string& line);

// Loads the referenced file and asks for confirmation if requested.
// Returns nullopt when the file is missing, unreadable or empty, or when the
// user declines; the reason has already been shown.
std::optional<std::string> load_file_message(const std::string& line,
                                             bool confirm_before_send,
                                             LineInput& input,
                                             Presenter& presenter);

} // namespace llmchat
