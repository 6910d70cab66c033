#pragma once

#include "core/Language.hpp"
#include <string_view>
#include <vector>

namespace docpatch {

/**
 * @brief Comment syntax of a language
 *
 * Empty tokens mean the language has no such construct.
 */
struct LanguageProfile {
    Language language = Language::UNKNOWN;
    std::string_view line_comment;             // "//" or "#"
    std::string_view block_open;               // "/*"
    std::string_view block_close;              // "*/"
    std::string_view doc_comment;              // "/**", "///", "\"\"\""
    std::vector<std::string_view> docstring_markers;  // Python triple quotes
    bool docstring_follows_definition = false; // Doc text lives inside the body

    /**
     * @brief Profile for a language (empty profile for UNKNOWN)
     */
    static const LanguageProfile& for_language(Language lang);
};

} // namespace docpatch
