#pragma once

#include "core/Language.hpp"
#include "core/LanguageProfile.hpp"
#include "core/SymbolRecord.hpp"
#include <map>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

extern "C" {
    struct TSLanguage;
}

namespace docpatch {

/**
 * @brief Syntax node kind that introduces a documentable definition
 */
struct DefinitionRule {
    std::string_view node_kind;
    SymbolKind kind;
    bool requires_body = false;  // Skip forward declarations such as `class A;`
};

/**
 * @brief A grammar that loaded and can be used for tree analysis
 */
struct ParsedGrammar {
    const TSLanguage* ts_language = nullptr;
    std::vector<DefinitionRule> definitions;
    std::vector<std::string_view> name_kinds;     // Node kinds that hold a name
    std::vector<std::string_view> wrapper_kinds;  // Parents that own the doc comment
};

/**
 * @brief A grammar that is not linked or failed to load
 */
struct GrammarUnavailable {
    std::string reason;
};

using GrammarState = std::variant<ParsedGrammar, GrammarUnavailable>;

/**
 * @brief One entry of a regex fallback table
 */
struct RegexRule {
    std::string source;  // Pattern text, for diagnostics
    std::regex pattern;  // Capture group 1 is the symbol name
    SymbolKind kind;
};

/**
 * @brief Everything the analyzers need to know about one language
 */
struct LanguageSupport {
    Language language = Language::UNKNOWN;
    const LanguageProfile* profile = nullptr;
    GrammarState grammar = GrammarUnavailable{"not resolved"};
    std::vector<RegexRule> regex_rules;
    std::set<std::string, std::less<>> reserved_words;  // Never reported as names

    const ParsedGrammar* parsed_grammar() const {
        return std::get_if<ParsedGrammar>(&grammar);
    }
};

/**
 * @brief Language tag -> profile, grammar state and regex table
 *
 * Built once per run. Grammar availability is probed while building and is
 * not re-evaluated afterwards; a language whose grammar does not load keeps
 * its regex table and is analyzed with the fallback engine.
 */
class LanguageRegistry {
public:
    struct Options {
        bool use_syntax_tree = true;
        std::set<Language> disabled_grammars;
        std::vector<Language> languages;  // Enabled languages; empty means all
    };

    /**
     * @brief Build the registry, probing every grammar once
     */
    static LanguageRegistry build(const Options& options);

    static LanguageRegistry build() { return build(Options{}); }

    /**
     * @brief Support entry for a language, nullptr if it is not enabled
     */
    const LanguageSupport* find(Language lang) const;

    bool supports(Language lang) const { return find(lang) != nullptr; }

    std::vector<Language> languages() const;

private:
    std::map<Language, LanguageSupport> entries_;
};

} // namespace docpatch
