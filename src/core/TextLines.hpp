#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docpatch {

/**
 * @brief Line-level helpers shared by the presence heuristic and the patcher
 */
namespace text {

/// Split on '\n'. A trailing newline yields a final empty element, so
/// join(split_lines(s)) == s.
std::vector<std::string_view> split_lines(std::string_view content);

std::string join_lines(const std::vector<std::string>& lines);

std::string_view trim(std::string_view text);

/// Leading spaces and tabs of a line
std::string_view leading_whitespace(std::string_view line);

bool starts_with(std::string_view text, std::string_view prefix);

bool contains(std::string_view text, std::string_view needle);

/// Zero-based index of the line holding byte @p offset
size_t line_index_at(std::string_view content, size_t offset);

/**
 * @brief Find the last line of a block header such as a Python `def`
 *
 * Follows bracket nesting from @p first so that signatures spanning several
 * lines are handled; brackets inside string literals and '#' comments are
 * ignored. The header ends on the first line where all brackets are closed;
 * it only counts when the code on that line ends with ':'.
 *
 * @return Index of the header's last line, or nullopt for one-liners and
 *         headers longer than a few dozen lines
 */
std::optional<size_t> block_header_end(const std::vector<std::string_view>& lines, size_t first);

}  // namespace text

} // namespace docpatch
