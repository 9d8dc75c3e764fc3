#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace agentrelay::response {

// Remove CSI/OSC escape sequences, stray C0 controls (except \n and \t) and DEL,
// fold \r\n and lone \r into \n, and turn UTF-8 non-breaking spaces into ' '.
std::string strip_control_sequences(std::string_view text);

// Split on '\n'. A single trailing newline does not produce an empty last line.
std::vector<std::string> split_lines(std::string_view text);

std::string join_lines(const std::vector<std::string>& lines, size_t begin, size_t end);
std::string join_lines(const std::vector<std::string>& lines);

std::string ltrim(std::string_view s);
std::string rtrim(std::string_view s);
std::string trim(std::string_view s);
bool is_blank(std::string_view s);

// Drop leading and trailing blank lines in place
void trim_blank_lines(std::vector<std::string>& lines);

}  // namespace agentrelay::response
