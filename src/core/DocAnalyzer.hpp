#pragma once

#include "core/IgnoreRules.hpp"
#include "core/LanguageRegistry.hpp"
#include "core/RegexEngine.hpp"
#include "core/SymbolRecord.hpp"
#include "core/SyntaxTreeEngine.hpp"
#include <filesystem>
#include <string_view>
#include <vector>

namespace docpatch {

/**
 * @brief High-level API for finding undocumented definitions
 *
 * Picks the syntax tree engine when a grammar is loaded for the file's
 * language and the regex engine otherwise. Ignored files, unknown languages
 * and unreadable files all produce an empty result; none of them abort a
 * directory walk.
 */
class DocAnalyzer {
public:
    /**
     * @brief Construct an analyzer
     * @param registry Language registry; must outlive the analyzer
     * @param ignore_rules Patterns excluding files and directories
     */
    DocAnalyzer(const LanguageRegistry& registry, IgnoreRuleSet ignore_rules);

    /**
     * @brief Analyze a single file
     * @param filepath Path to the file
     * @return Undocumented symbols in discovery order (empty if the file is
     *         ignored, unsupported or unreadable)
     */
    std::vector<SymbolRecord> analyze_file(const std::filesystem::path& filepath);

    /**
     * @brief Analyze in-memory content
     * @param content Source text
     * @param lang Language of the text
     * @param filepath Path recorded in the returned records
     * @return Undocumented symbols in discovery order
     */
    std::vector<SymbolRecord> analyze_source(std::string_view content,
                                             Language lang,
                                             const std::filesystem::path& filepath);

    /**
     * @brief Analyze every supported file below a directory
     *
     * Ignored directories are pruned, not descended into. Files without
     * findings are left out of the result.
     *
     * @param directory Root of the walk; a regular file is analyzed alone
     * @return File path -> undocumented symbols
     */
    AnalysisResult analyze_directory(const std::filesystem::path& directory);

    const LanguageRegistry& registry() const { return registry_; }

    const IgnoreRuleSet& ignore_rules() const { return ignore_rules_; }

private:
    /**
     * @brief Read and analyze a file that already passed the ignore check
     */
    std::vector<SymbolRecord> analyze_path(const std::filesystem::path& filepath);

    const LanguageRegistry& registry_;
    IgnoreRuleSet ignore_rules_;
    SyntaxTreeEngine tree_engine_;
    RegexEngine regex_engine_;
};

} // namespace docpatch
