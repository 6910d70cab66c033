#include "core/SyntaxArena.hpp"
#include <spdlog/spdlog.h>

extern "C" {
    #include <tree_sitter/api.h>
}

namespace docpatch {

namespace {

SyntaxNode make_node(const TSTreeCursor& cursor, uint32_t parent) {
    TSNode ts_node = ts_tree_cursor_current_node(&cursor);
    const char* field = ts_tree_cursor_current_field_name(&cursor);

    SyntaxNode node;
    node.kind = ts_node_type(ts_node);
    node.field = field ? std::string_view(field) : std::string_view();
    node.start_byte = ts_node_start_byte(ts_node);
    node.end_byte = ts_node_end_byte(ts_node);
    node.start_row = ts_node_start_point(ts_node).row;
    node.parent = parent;
    node.named = ts_node_is_named(ts_node);
    return node;
}

}  // namespace

SyntaxArena SyntaxArena::build(const Tree& tree) {
    SyntaxArena arena;
    TSTreeCursor cursor = ts_tree_cursor_new(tree.root_node());

    arena.nodes_.push_back(make_node(cursor, kNoParent));

    // Arena index of every node on the cursor's current path
    std::vector<uint32_t> path{0};

    auto append_current = [&]() {
        uint32_t parent = path.back();
        auto index = static_cast<uint32_t>(arena.nodes_.size());
        arena.nodes_.push_back(make_node(cursor, parent));
        arena.nodes_[parent].children.push_back(index);
        path.push_back(index);
    };

    bool done = false;
    while (!done) {
        if (ts_tree_cursor_goto_first_child(&cursor)) {
            append_current();
            continue;
        }

        // Leaf: move to the next sibling, climbing as far as needed
        while (true) {
            path.pop_back();
            if (ts_tree_cursor_goto_next_sibling(&cursor)) {
                append_current();
                break;
            }
            if (!ts_tree_cursor_goto_parent(&cursor)) {
                done = true;
                break;
            }
        }
    }

    ts_tree_cursor_delete(&cursor);

    spdlog::trace("Flattened syntax tree into {} nodes", arena.nodes_.size());
    return arena;
}

std::optional<uint32_t> SyntaxArena::child_by_field(uint32_t index, std::string_view field) const {
    for (uint32_t child : node(index).children) {
        if (nodes_[child].field == field) {
            return child;
        }
    }
    return std::nullopt;
}

std::string_view SyntaxArena::text(uint32_t index, std::string_view source) const {
    const SyntaxNode& n = node(index);
    if (n.start_byte >= source.size() || n.end_byte > source.size() || n.start_byte >= n.end_byte) {
        return {};
    }
    return source.substr(n.start_byte, n.end_byte - n.start_byte);
}

} // namespace docpatch
