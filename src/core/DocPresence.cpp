#include "core/DocPresence.hpp"
#include "core/TextLines.hpp"
#include <algorithm>
#include <array>

namespace docpatch {

bool DocPresence::is_documented(std::string_view content, size_t offset, Language lang) {
    const LanguageProfile& profile = LanguageProfile::for_language(lang);
    offset = std::min(offset, content.size());

    // Start of the line holding the definition
    size_t line_start = 0;
    if (offset > 0) {
        size_t newline = content.rfind('\n', offset - 1);
        line_start = (newline == std::string_view::npos) ? 0 : newline + 1;
    }

    // Walk preceding lines bottom-up; `end` is the '\n' closing the current line
    size_t end = line_start;
    for (size_t examined = 0; examined < kWindowLines && end > 0; ++examined) {
        size_t closing = end - 1;
        size_t newline = closing == 0 ? std::string_view::npos : content.rfind('\n', closing - 1);
        size_t begin = (newline == std::string_view::npos) ? 0 : newline + 1;

        std::string_view line = text::trim(content.substr(begin, closing - begin));
        end = begin;

        if (line.empty()) {
            continue;
        }
        if (opens_comment(line, profile)) {
            return true;
        }
        if (!is_comment_continuation(line)) {
            break;
        }
    }

    if (profile.docstring_follows_definition) {
        return has_docstring_after(content, offset, profile);
    }

    return false;
}

bool DocPresence::opens_comment(std::string_view trimmed_line, const LanguageProfile& profile) {
    if (text::starts_with(trimmed_line, profile.line_comment)) {
        return true;
    }
    if (text::contains(trimmed_line, profile.block_open) ||
        text::contains(trimmed_line, profile.block_close)) {
        return true;
    }
    return std::any_of(profile.docstring_markers.begin(), profile.docstring_markers.end(),
                       [&](std::string_view marker) {
                           return text::contains(trimmed_line, marker);
                       });
}

bool DocPresence::is_comment_continuation(std::string_view trimmed_line) {
    static constexpr std::array<std::string_view, 5> prefixes = {"//", "#", "/*", "*", "///"};
    return std::any_of(prefixes.begin(), prefixes.end(), [&](std::string_view prefix) {
        return text::starts_with(trimmed_line, prefix);
    });
}

bool DocPresence::has_docstring_after(std::string_view content, size_t offset,
                                      const LanguageProfile& profile) {
    auto lines = text::split_lines(content);
    size_t first = text::line_index_at(content, offset);

    auto header_end = text::block_header_end(lines, first);
    if (!header_end) {
        return false;
    }

    for (size_t i = *header_end + 1; i < lines.size(); ++i) {
        std::string_view line = text::trim(lines[i]);
        if (line.empty()) {
            continue;
        }

        // String prefixes: r"""...""", u'''...'''
        if (line.front() == 'r' || line.front() == 'R' ||
            line.front() == 'u' || line.front() == 'U') {
            line.remove_prefix(1);
        }
        return std::any_of(profile.docstring_markers.begin(), profile.docstring_markers.end(),
                           [&](std::string_view marker) {
                               return text::starts_with(line, marker);
                           });
    }

    return false;
}

} // namespace docpatch
