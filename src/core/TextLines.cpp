#include "core/TextLines.hpp"
#include <algorithm>

namespace docpatch {
namespace text {

namespace {

constexpr size_t kMaxHeaderLines = 32;

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

struct HeaderScan {
    int depth = 0;
    char quote = 0;       // Delimiter of the string being scanned, 0 outside strings
    bool triple = false;
};

bool is_triple(std::string_view line, size_t pos, char quote) {
    return pos + 2 < line.size() && line[pos] == quote && line[pos + 1] == quote &&
           line[pos + 2] == quote;
}

// Track bracket depth over one line, skipping string literals and '#'
// comments. Returns the last character of code on the line, 0 if none.
char scan_header_line(std::string_view line, HeaderScan& state) {
    char last = 0;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (state.quote) {
            if (c == '\\') {
                ++i;
            } else if (state.triple && is_triple(line, i, state.quote)) {
                i += 2;
                state.quote = 0;
                last = c;
            } else if (!state.triple && c == state.quote) {
                state.quote = 0;
                last = c;
            }
            continue;
        }

        if (c == '#') {
            break;
        }
        if (c == '"' || c == '\'') {
            state.quote = c;
            state.triple = is_triple(line, i, c);
            if (state.triple) {
                i += 2;
            }
            continue;
        }

        if (c == '(' || c == '[' || c == '{') {
            ++state.depth;
        } else if (c == ')' || c == ']' || c == '}') {
            --state.depth;
        }
        if (!is_space(c)) {
            last = c;
        }
    }

    // Only triple-quoted strings and backslash continuations span lines
    if (state.quote && !state.triple && (line.empty() || line.back() != '\\')) {
        state.quote = 0;
    }

    return last;
}

}  // namespace

std::vector<std::string_view> split_lines(std::string_view content) {
    std::vector<std::string_view> lines;
    size_t start = 0;

    while (true) {
        size_t newline = content.find('\n', start);
        if (newline == std::string_view::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, newline - start));
        start = newline + 1;
    }

    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            result += '\n';
        }
        result += lines[i];
    }
    return result;
}

std::string_view trim(std::string_view text) {
    size_t begin = 0;
    while (begin < text.size() && is_space(text[begin])) {
        ++begin;
    }
    size_t end = text.size();
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string_view leading_whitespace(std::string_view line) {
    size_t count = 0;
    while (count < line.size() && (line[count] == ' ' || line[count] == '\t')) {
        ++count;
    }
    return line.substr(0, count);
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return !prefix.empty() && text.substr(0, prefix.size()) == prefix;
}

bool contains(std::string_view text, std::string_view needle) {
    return !needle.empty() && text.find(needle) != std::string_view::npos;
}

size_t line_index_at(std::string_view content, size_t offset) {
    offset = std::min(offset, content.size());
    return static_cast<size_t>(std::count(content.begin(), content.begin() + offset, '\n'));
}

std::optional<size_t> block_header_end(const std::vector<std::string_view>& lines, size_t first) {
    HeaderScan state;

    for (size_t i = first; i < lines.size() && i < first + kMaxHeaderLines; ++i) {
        char last = scan_header_line(lines[i], state);
        if (state.quote || state.depth > 0) {
            continue;
        }
        if (last == ':') {
            return i;
        }
        return std::nullopt;
    }

    return std::nullopt;
}

}  // namespace text
} // namespace docpatch
