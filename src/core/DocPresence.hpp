#pragma once

#include "core/Language.hpp"
#include "core/LanguageProfile.hpp"
#include <cstddef>
#include <string_view>

namespace docpatch {

/**
 * @brief Adjacency heuristic deciding whether a definition is documented
 *
 * Looks at the last kWindowLines lines above the definition line,
 * nearest first. A line that opens a comment (line comment, block comment
 * marker, docstring marker) means documented. A non-blank line that does not
 * start like a comment continuation (line comment token, block comment
 * opener, leading `*`) ends the search. Blank lines are skipped but still
 * count against the window.
 *
 * The check does not verify that a comment block is terminated or that it
 * belongs to this definition: a comment of a previous symbol separated only
 * by blank lines counts as documentation of the next one.
 *
 * For languages whose docstring lives in the body (Python), a docstring on
 * the first non-blank line after the definition header also counts.
 */
class DocPresence {
public:
    static constexpr size_t kWindowLines = 5;

    /**
     * @brief Check whether the definition at @p offset is documented
     * @param content Full file content
     * @param offset Zero-based byte offset of the definition
     * @param lang Language of the content
     */
    static bool is_documented(std::string_view content, size_t offset, Language lang);

    /**
     * @brief Check whether a trimmed line opens a comment in this language
     */
    static bool opens_comment(std::string_view trimmed_line, const LanguageProfile& profile);

private:
    static bool is_comment_continuation(std::string_view trimmed_line);

    static bool has_docstring_after(std::string_view content, size_t offset,
                                    const LanguageProfile& profile);
};

} // namespace docpatch
