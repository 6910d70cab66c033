#pragma once

#include <memory>
#include <string>
#include <string_view>
#include "core/Language.hpp"

// Forward declarations for tree-sitter C API
extern "C" {
    struct TSParser;
    struct TSTree;
    struct TSNode;
}

namespace docpatch {

/**
 * @brief RAII wrapper for TSTree from tree-sitter
 *
 * Manages the lifetime of a TSTree object, ensuring proper cleanup.
 */
class Tree {
public:
    explicit Tree(TSTree* tree);
    ~Tree();

    // Delete copy operations
    Tree(const Tree&) = delete;
    Tree& operator=(const Tree&) = delete;

    // Move operations
    Tree(Tree&& other) noexcept;
    Tree& operator=(Tree&& other) noexcept;

    /**
     * @brief Get the root node of the syntax tree
     */
    TSNode root_node() const;

    /**
     * @brief Check if the tree has any syntax errors
     */
    bool has_error() const;

    /**
     * @brief Get the underlying TSTree pointer
     */
    TSTree* get() const { return tree_; }

private:
    TSTree* tree_;
};

/**
 * @brief RAII parser for one language grammar
 *
 * Wraps the tree-sitter C API. Instances are created once per language when
 * the analysis engine is set up and reused for every file of that language.
 */
class TreeSitterParser {
public:
    /**
     * @brief Construct a parser for a language
     * @param lang Programming language to parse
     * @throws std::runtime_error if no grammar is linked for the language or
     *         the grammar is incompatible with the tree-sitter runtime
     */
    explicit TreeSitterParser(Language lang);

    ~TreeSitterParser();

    // Delete copy operations
    TreeSitterParser(const TreeSitterParser&) = delete;
    TreeSitterParser& operator=(const TreeSitterParser&) = delete;

    // Move operations
    TreeSitterParser(TreeSitterParser&& other) noexcept;
    TreeSitterParser& operator=(TreeSitterParser&& other) noexcept;

    /**
     * @brief Parse source code from a string
     * @param source Source code to parse
     * @return Unique pointer to parsed tree, or nullptr on error
     */
    std::unique_ptr<Tree> parse_string(std::string_view source);

    Language language() const { return language_; }

private:
    TSParser* parser_;
    Language language_;
};

} // namespace docpatch
