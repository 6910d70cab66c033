#include "core/SyntaxTreeEngine.hpp"
#include "core/DocPresence.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace docpatch {

namespace {

constexpr int kMaxDeclaratorDepth = 16;

bool contains_kind(const std::vector<std::string_view>& kinds, std::string_view kind) {
    return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.substr(text.size() - suffix.size()) == suffix;
}

}  // namespace

SyntaxTreeEngine::SyntaxTreeEngine(const LanguageRegistry& registry) {
    for (Language lang : registry.languages()) {
        const LanguageSupport* support = registry.find(lang);
        if (!support || !support->parsed_grammar()) {
            continue;
        }

        try {
            parsers_.emplace(std::piecewise_construct,
                             std::forward_as_tuple(lang),
                             std::forward_as_tuple(lang));
        } catch (const std::runtime_error& e) {
            spdlog::warn("Parser for {} could not be created: {}",
                         LanguageUtils::to_string(lang), e.what());
        }
    }

    spdlog::debug("SyntaxTreeEngine created with {} parsers", parsers_.size());
}

std::optional<std::vector<SymbolRecord>> SyntaxTreeEngine::analyze(
    const LanguageSupport& support,
    std::string_view content,
    const std::filesystem::path& filepath
) {
    const ParsedGrammar* grammar = support.parsed_grammar();
    auto parser_it = parsers_.find(support.language);
    if (!grammar || parser_it == parsers_.end()) {
        return std::nullopt;
    }

    auto tree = parser_it->second.parse_string(content);
    if (!tree) {
        return std::nullopt;
    }

    SyntaxArena arena = SyntaxArena::build(*tree);
    std::vector<SymbolRecord> undocumented;

    // Pre-order walk with an explicit stack; children pushed in reverse
    std::vector<uint32_t> stack{0};
    while (!stack.empty()) {
        uint32_t index = stack.back();
        stack.pop_back();

        const SyntaxNode& node = arena.node(index);
        for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
            stack.push_back(*it);
        }

        const DefinitionRule* rule = match_rule(arena, index, *grammar);
        if (!rule) {
            continue;
        }

        auto name = resolve_name(arena, index, *grammar, content);
        if (!name) {
            spdlog::trace("Skipping unnamed {} at row {}", node.kind, node.start_row + 1);
            continue;
        }

        const SyntaxNode& anchor = arena.node(documentation_anchor(arena, index, *grammar));
        if (DocPresence::is_documented(content, anchor.start_byte, support.language)) {
            continue;
        }

        SymbolRecord record;
        record.name = std::move(*name);
        record.kind = rule->kind;
        record.source_file = filepath;
        record.line = anchor.start_row + 1;
        record.offset = anchor.start_byte;
        record.language = support.language;
        undocumented.push_back(std::move(record));
    }

    spdlog::debug("Syntax tree analysis of {} found {} undocumented symbols ({} nodes)",
                  filepath.string(), undocumented.size(), arena.size());
    return undocumented;
}

const DefinitionRule* SyntaxTreeEngine::match_rule(const SyntaxArena& arena,
                                                   uint32_t index,
                                                   const ParsedGrammar& grammar) {
    const SyntaxNode& node = arena.node(index);
    if (!node.named) {
        return nullptr;
    }

    for (const auto& rule : grammar.definitions) {
        if (rule.node_kind != node.kind) {
            continue;
        }
        if (rule.requires_body && !arena.child_by_field(index, "body")) {
            return nullptr;
        }
        return &rule;
    }

    return nullptr;
}

std::optional<std::string> SyntaxTreeEngine::resolve_name(const SyntaxArena& arena,
                                                          uint32_t index,
                                                          const ParsedGrammar& grammar,
                                                          std::string_view source) {
    std::optional<uint32_t> current = arena.child_by_field(index, "declarator");
    const bool has_declarator = current.has_value();

    for (int depth = 0; current && depth < kMaxDeclaratorDepth; ++depth) {
        const SyntaxNode& node = arena.node(*current);

        if (contains_kind(grammar.name_kinds, node.kind)) {
            std::string_view text = arena.text(*current, source);
            if (text.empty()) {
                return std::nullopt;
            }
            return std::string(text);
        }

        if (node.kind == "qualified_identifier") {
            current = arena.child_by_field(*current, "name");
            continue;
        }

        // reference_declarator keeps its inner declarator without a field name
        std::optional<uint32_t> next = arena.child_by_field(*current, "declarator");
        if (!next) {
            for (uint32_t child : node.children) {
                const SyntaxNode& candidate = arena.node(child);
                if (candidate.named &&
                    (ends_with(candidate.kind, "declarator") ||
                     contains_kind(grammar.name_kinds, candidate.kind) ||
                     candidate.kind == "qualified_identifier")) {
                    next = child;
                    break;
                }
            }
        }
        current = next;
    }

    if (has_declarator) {
        // Other direct children are return types, not the name
        return std::nullopt;
    }

    for (uint32_t child : arena.node(index).children) {
        const SyntaxNode& node = arena.node(child);
        if (node.named && contains_kind(grammar.name_kinds, node.kind)) {
            std::string_view text = arena.text(child, source);
            if (!text.empty()) {
                return std::string(text);
            }
        }
    }

    return std::nullopt;
}

uint32_t SyntaxTreeEngine::documentation_anchor(const SyntaxArena& arena,
                                                uint32_t index,
                                                const ParsedGrammar& grammar) {
    uint32_t anchor = index;
    while (true) {
        uint32_t parent = arena.node(anchor).parent;
        if (parent == SyntaxArena::kNoParent ||
            !contains_kind(grammar.wrapper_kinds, arena.node(parent).kind)) {
            return anchor;
        }
        anchor = parent;
    }
}

} // namespace docpatch
