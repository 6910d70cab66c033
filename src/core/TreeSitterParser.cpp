#include "core/TreeSitterParser.hpp"
#include "core/Language.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

// Tree-sitter C API
extern "C" {
    #include <tree_sitter/api.h>
}

namespace docpatch {

// ============================================================================
// Tree implementation
// ============================================================================

Tree::Tree(TSTree* tree) : tree_(tree) {
    if (!tree_) {
        throw std::invalid_argument("Cannot create Tree with nullptr");
    }
}

Tree::~Tree() {
    if (tree_) {
        ts_tree_delete(tree_);
    }
}

Tree::Tree(Tree&& other) noexcept : tree_(other.tree_) {
    other.tree_ = nullptr;
}

Tree& Tree::operator=(Tree&& other) noexcept {
    if (this != &other) {
        if (tree_) {
            ts_tree_delete(tree_);
        }
        tree_ = other.tree_;
        other.tree_ = nullptr;
    }
    return *this;
}

TSNode Tree::root_node() const {
    return ts_tree_root_node(tree_);
}

bool Tree::has_error() const {
    return ts_node_has_error(root_node());
}

// ============================================================================
// TreeSitterParser implementation
// ============================================================================

TreeSitterParser::TreeSitterParser(Language lang)
    : parser_(nullptr), language_(lang) {
    const TSLanguage* ts_lang = LanguageUtils::get_ts_language(lang);
    if (!ts_lang) {
        throw std::runtime_error("No grammar linked for language: " +
                                 std::string(LanguageUtils::to_string(lang)));
    }

    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("Failed to create TSParser");
    }

    // Fails when the grammar ABI is outside the runtime's supported range
    if (!ts_parser_set_language(parser_, ts_lang)) {
        ts_parser_delete(parser_);
        parser_ = nullptr;
        throw std::runtime_error("Incompatible grammar version for language: " +
                                 std::string(LanguageUtils::to_string(lang)));
    }

    spdlog::debug("TreeSitterParser created for language: {}",
                  LanguageUtils::to_string(lang));
}

TreeSitterParser::~TreeSitterParser() {
    if (parser_) {
        ts_parser_delete(parser_);
    }
}

TreeSitterParser::TreeSitterParser(TreeSitterParser&& other) noexcept
    : parser_(other.parser_), language_(other.language_) {
    other.parser_ = nullptr;
}

TreeSitterParser& TreeSitterParser::operator=(TreeSitterParser&& other) noexcept {
    if (this != &other) {
        if (parser_) {
            ts_parser_delete(parser_);
        }
        parser_ = other.parser_;
        language_ = other.language_;
        other.parser_ = nullptr;
    }
    return *this;
}

std::unique_ptr<Tree> TreeSitterParser::parse_string(std::string_view source) {
    spdlog::trace("Parsing {} bytes of {}", source.size(), LanguageUtils::to_string(language_));

    TSTree* raw_tree = ts_parser_parse_string(
        parser_,
        nullptr,  // old_tree
        source.data(),
        static_cast<uint32_t>(source.size())
    );

    if (!raw_tree) {
        spdlog::error("Failed to parse source code");
        return nullptr;
    }

    auto tree = std::make_unique<Tree>(raw_tree);

    if (tree->has_error()) {
        // Definitions outside the damaged region are still reported
        spdlog::debug("Parse completed with syntax errors");
    }

    return tree;
}

} // namespace docpatch
