#pragma once

#include "core/TreeSitterParser.hpp"
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <vector>

namespace docpatch {

/**
 * @brief One node of a flattened syntax tree
 */
struct SyntaxNode {
    std::string_view kind;   // Grammar node type, owned by the TSLanguage
    std::string_view field;  // Field name within the parent, empty if none
    uint32_t start_byte = 0;
    uint32_t end_byte = 0;
    uint32_t start_row = 0;  // 0-based
    uint32_t parent = 0;
    bool named = false;
    std::vector<uint32_t> children;
};

/**
 * @brief Syntax tree copied into a flat vector with index-based child lists
 *
 * Built with a tree cursor instead of recursion, so deeply nested sources
 * cannot exhaust the call stack. Nodes are stored in pre-order; index 0 is
 * the root.
 */
class SyntaxArena {
public:
    static constexpr uint32_t kNoParent = std::numeric_limits<uint32_t>::max();

    /**
     * @brief Flatten a parsed tree
     * @param tree Parsed tree; positions are copied, kind and field names
     *             point into the grammar's static tables
     */
    static SyntaxArena build(const Tree& tree);

    const SyntaxNode& node(uint32_t index) const { return nodes_.at(index); }

    const std::vector<SyntaxNode>& nodes() const { return nodes_; }

    size_t size() const { return nodes_.size(); }

    /**
     * @brief First child of a node registered under a field name
     */
    std::optional<uint32_t> child_by_field(uint32_t index, std::string_view field) const;

    /**
     * @brief Source text covered by a node
     */
    std::string_view text(uint32_t index, std::string_view source) const;

private:
    std::vector<SyntaxNode> nodes_;
};

} // namespace docpatch
