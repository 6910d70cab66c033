#include "core/LanguageRegistry.hpp"
#include "core/TreeSitterParser.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace docpatch {

namespace {

RegexRule rule(const char* pattern, SymbolKind kind) {
    return {pattern, std::regex(pattern, std::regex::ECMAScript | std::regex::optimize), kind};
}

std::vector<RegexRule> regex_rules_for(Language lang) {
    switch (lang) {
        case Language::PYTHON:
            return {
                rule(R"(def\s+(\w+)\s*\()", SymbolKind::FUNCTION),
                rule(R"(class\s+(\w+)\s*[\(:])", SymbolKind::CLASS),
            };
        case Language::JAVASCRIPT:
        case Language::TYPESCRIPT:
            return {
                rule(R"(function\s+(\w+)\s*\()", SymbolKind::FUNCTION),
                rule(R"(const\s+(\w+)\s*=\s*\()", SymbolKind::FUNCTION),
                rule(R"(let\s+(\w+)\s*=\s*\()", SymbolKind::FUNCTION),
                rule(R"(var\s+(\w+)\s*=\s*\()", SymbolKind::FUNCTION),
                rule(R"((\w+)\s*:\s*function)", SymbolKind::FUNCTION),
                rule(R"(class\s+(\w+)\s*[{\s])", SymbolKind::CLASS),
            };
        case Language::JAVA:
            return {
                rule(R"((?:class|interface|enum)\s+(\w+))", SymbolKind::CLASS),
                rule(R"((?:public|protected|private)\s+(?:static\s+)?(?:final\s+)?(?:synchronized\s+)?[\w<>\[\],]+\s+(\w+)\s*\()",
                     SymbolKind::FUNCTION),
            };
        case Language::GO:
            return {
                rule(R"(func\s+(?:\([^)]*\)\s*)?(\w+)\s*[\[(])", SymbolKind::FUNCTION),
                rule(R"(type\s+(\w+)\s+(?:struct|interface)\b)", SymbolKind::CLASS),
            };
        case Language::RUST:
            return {
                rule(R"(fn\s+(\w+)\s*[<(])", SymbolKind::FUNCTION),
                rule(R"((?:struct|enum|trait)\s+(\w+))", SymbolKind::CLASS),
            };
        case Language::CPP:
        case Language::C:
            return {
                rule(R"((?:class|struct)\s+(\w+)\s*(?:final\s*)?(?::[^;{]*)?\{)", SymbolKind::CLASS),
                rule(R"([\w:<>\*&]+[ \t\*&]+(\w+)\s*\([^;{}()]*\)\s*(?:const\s*)?(?:noexcept\s*)?\{)",
                     SymbolKind::FUNCTION),
            };
        default:
            return {};
    }
}

std::set<std::string, std::less<>> reserved_words_for(Language lang) {
    switch (lang) {
        case Language::JAVASCRIPT:
        case Language::TYPESCRIPT:
            return {"if", "for", "while", "switch", "catch", "return", "case", "default"};
        case Language::JAVA:
            return {"if", "for", "while", "switch", "catch", "return", "new"};
        case Language::CPP:
        case Language::C:
            return {"if", "for", "while", "switch", "catch", "return", "sizeof", "else", "do"};
        default:
            return {};
    }
}

GrammarState grammar_for(Language lang) {
    ParsedGrammar grammar;
    grammar.ts_language = LanguageUtils::get_ts_language(lang);
    if (!grammar.ts_language) {
        return GrammarUnavailable{"no grammar linked"};
    }

    switch (lang) {
        case Language::PYTHON:
            grammar.definitions = {
                {"function_definition", SymbolKind::FUNCTION},
                {"class_definition", SymbolKind::CLASS},
            };
            grammar.name_kinds = {"identifier"};
            break;
        case Language::CPP:
        case Language::C:
            grammar.definitions = {
                {"function_definition", SymbolKind::FUNCTION},
                {"class_specifier", SymbolKind::CLASS, true},
                {"struct_specifier", SymbolKind::CLASS, true},
            };
            grammar.name_kinds = {"identifier", "field_identifier", "type_identifier",
                                  "destructor_name", "operator_name"};
            grammar.wrapper_kinds = {"template_declaration"};
            break;
        default:
            return GrammarUnavailable{"no definition table for grammar"};
    }

    return grammar;
}

}  // namespace

LanguageRegistry LanguageRegistry::build(const Options& options) {
    LanguageRegistry registry;

    const std::vector<Language>& enabled =
        options.languages.empty() ? LanguageUtils::all() : options.languages;

    for (Language lang : enabled) {
        if (lang == Language::UNKNOWN || registry.entries_.count(lang)) {
            continue;
        }

        LanguageSupport support;
        support.language = lang;
        support.profile = &LanguageProfile::for_language(lang);
        support.regex_rules = regex_rules_for(lang);
        support.reserved_words = reserved_words_for(lang);

        if (!options.use_syntax_tree) {
            support.grammar = GrammarUnavailable{"syntax tree analysis disabled"};
        } else if (options.disabled_grammars.count(lang)) {
            support.grammar = GrammarUnavailable{"grammar disabled by configuration"};
        } else {
            support.grammar = grammar_for(lang);
            if (support.parsed_grammar()) {
                // Probe once; an ABI mismatch shows up here, not per file
                try {
                    TreeSitterParser probe(lang);
                } catch (const std::runtime_error& e) {
                    spdlog::warn("Grammar for {} unavailable, falling back to regex analysis: {}",
                                 LanguageUtils::to_string(lang), e.what());
                    support.grammar = GrammarUnavailable{e.what()};
                }
            }
        }

        if (auto* unavailable = std::get_if<GrammarUnavailable>(&support.grammar)) {
            if (support.regex_rules.empty()) {
                spdlog::warn("No analysis engine for {}: {}",
                             LanguageUtils::to_string(lang), unavailable->reason);
            } else {
                spdlog::debug("Using regex analysis for {}: {}",
                              LanguageUtils::to_string(lang), unavailable->reason);
            }
        }

        registry.entries_.emplace(lang, std::move(support));
    }

    spdlog::debug("Language registry built with {} languages", registry.entries_.size());
    return registry;
}

const LanguageSupport* LanguageRegistry::find(Language lang) const {
    auto it = entries_.find(lang);
    return it != entries_.end() ? &it->second : nullptr;
}

std::vector<Language> LanguageRegistry::languages() const {
    std::vector<Language> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace docpatch
