#pragma once

#include "core/LanguageRegistry.hpp"
#include "core/SymbolRecord.hpp"
#include "core/SyntaxArena.hpp"
#include "core/TreeSitterParser.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docpatch {

/**
 * @brief Analysis of undocumented definitions on tree-sitter syntax trees
 *
 * Owns one parser per language whose grammar the registry reports as
 * parsed. Parsers are created up front; nothing is created lazily while
 * files are analyzed.
 */
class SyntaxTreeEngine {
public:
    explicit SyntaxTreeEngine(const LanguageRegistry& registry);

    /**
     * @brief Check whether a parser exists for a language
     */
    bool can_parse(Language lang) const { return parsers_.count(lang) > 0; }

    /**
     * @brief Find undocumented definitions in a source text
     *
     * Walks the tree in pre-order, so enclosing definitions are reported
     * before nested ones. Definitions without a resolvable name are skipped.
     *
     * @param support Registry entry of the content's language
     * @param content Full file content
     * @param filepath Path recorded in each SymbolRecord
     * @return Undocumented symbols in discovery order, or nullopt if the
     *         language has no parser or tree-sitter returned no tree
     */
    std::optional<std::vector<SymbolRecord>> analyze(const LanguageSupport& support,
                                                     std::string_view content,
                                                     const std::filesystem::path& filepath);

private:
    /**
     * @brief Resolve the identifier naming a definition node
     *
     * Follows the `declarator` chain first (C and C++ keep the name inside
     * nested declarators), then falls back to the first identifier child.
     */
    static std::optional<std::string> resolve_name(const SyntaxArena& arena,
                                                   uint32_t index,
                                                   const ParsedGrammar& grammar,
                                                   std::string_view source);

    static const DefinitionRule* match_rule(const SyntaxArena& arena,
                                            uint32_t index,
                                            const ParsedGrammar& grammar);

    /**
     * @brief Node whose start position owns the doc comment
     *
     * Climbs through wrapper nodes such as C++ `template_declaration`.
     */
    static uint32_t documentation_anchor(const SyntaxArena& arena,
                                         uint32_t index,
                                         const ParsedGrammar& grammar);

    std::map<Language, TreeSitterParser> parsers_;
};

} // namespace docpatch
