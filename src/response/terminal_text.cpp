#include "agentrelay/response/terminal_text.hpp"

#include <algorithm>
#include <cstddef>

namespace agentrelay::response {

namespace {

constexpr char kEsc = '\x1b';
constexpr char kBel = '\x07';

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\v' || c == '\f';
}

}  // namespace

std::string strip_control_sequences(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        char c = text[i];

        if (c == kEsc) {
            if (i + 1 >= n) {
                break;
            }
            char next = text[i + 1];
            if (next == '[') {
                // CSI: parameters and intermediates, then one final byte in 0x40-0x7E
                size_t j = i + 2;
                while (j < n && !(text[j] >= 0x40 && text[j] <= 0x7E)) {
                    ++j;
                }
                i = (j < n) ? j + 1 : n;
            } else if (next == ']' || next == 'P' || next == '_' || next == '^') {
                // OSC/DCS/APC/PM: terminated by BEL or ST (ESC \)
                size_t j = i + 2;
                while (j < n) {
                    if (text[j] == kBel) {
                        ++j;
                        break;
                    }
                    if (text[j] == kEsc && j + 1 < n && text[j + 1] == '\\') {
                        j += 2;
                        break;
                    }
                    ++j;
                }
                i = j;
            } else {
                // Two-byte escape (charset selection, keypad mode, ...)
                i += 2;
            }
            continue;
        }

        if (c == '\r') {
            out.push_back('\n');
            if (i + 1 < n && text[i + 1] == '\n') {
                ++i;
            }
            ++i;
            continue;
        }

        // U+00A0 no-break space
        if (static_cast<unsigned char>(c) == 0xC2 && i + 1 < n &&
            static_cast<unsigned char>(text[i + 1]) == 0xA0) {
            out.push_back(' ');
            i += 2;
            continue;
        }

        unsigned char uc = static_cast<unsigned char>(c);
        if ((uc < 0x20 && c != '\n' && c != '\t') || uc == 0x7F) {
            ++i;
            continue;
        }

        out.push_back(c);
        ++i;
    }

    return out;
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    if (text.empty()) {
        return lines;
    }

    size_t start = 0;
    while (start <= text.size()) {
        size_t pos = text.find('\n', start);
        if (pos == std::string_view::npos) {
            if (start < text.size()) {
                lines.emplace_back(text.substr(start));
            }
            break;
        }
        lines.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines, size_t begin, size_t end) {
    std::string out;
    end = std::min(end, lines.size());
    for (size_t i = begin; i < end; ++i) {
        if (i > begin) {
            out.push_back('\n');
        }
        out += lines[i];
    }
    return out;
}

std::string join_lines(const std::vector<std::string>& lines) {
    return join_lines(lines, 0, lines.size());
}

std::string ltrim(std::string_view s) {
    size_t i = 0;
    while (i < s.size() && is_space(s[i])) {
        ++i;
    }
    return std::string(s.substr(i));
}

std::string rtrim(std::string_view s) {
    size_t end = s.size();
    while (end > 0 && is_space(s[end - 1])) {
        --end;
    }
    return std::string(s.substr(0, end));
}

std::string trim(std::string_view s) {
    return rtrim(ltrim(s));
}

bool is_blank(std::string_view s) {
    for (char c : s) {
        if (!is_space(c)) {
            return false;
        }
    }
    return true;
}

void trim_blank_lines(std::vector<std::string>& lines) {
    while (!lines.empty() && is_blank(lines.back())) {
        lines.pop_back();
    }
    size_t first = 0;
    while (first < lines.size() && is_blank(lines[first])) {
        ++first;
    }
    lines.erase(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(first));
}

}  // namespace agentrelay::response
