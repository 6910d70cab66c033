#pragma once

#include "core/LanguageRegistry.hpp"
#include "core/SymbolRecord.hpp"
#include <filesystem>
#include <string_view>
#include <vector>

namespace docpatch {

/**
 * @brief Fallback analysis approximating definitions with regex tables
 *
 * Every rule of the language's table runs over the whole text on its own.
 * A region matched by one rule is not excluded from later rules, so the same
 * position can be reported twice with different kinds; callers must tolerate
 * such duplicates.
 */
class RegexEngine {
public:
    /**
     * @brief Find undocumented definitions in a source text
     * @param support Registry entry of the content's language
     * @param content Full file content
     * @param filepath Path recorded in each SymbolRecord
     * @return Undocumented symbols, grouped by rule in table order
     */
    std::vector<SymbolRecord> analyze(const LanguageSupport& support,
                                      std::string_view content,
                                      const std::filesystem::path& filepath) const;
};

} // namespace docpatch
