#pragma once

#include "node_tree.hpp"

#include <string>
#include <string_view>

namespace prepress {

// Parses tag markup (`<tag attr="v">text</tag>`) and appends the resulting
// nodes to `parent`. The reader is permissive: unknown entities and stray
// `<` stay literal, unmatched closing tags are ignored and open elements are
// closed at the end of the input. `img`, `br` and `hr` never take children.
// Returns `false` only if the tree refused a mutation.
[[nodiscard]] bool read_markup(
    node_tree& tree, const node_id parent, const std::string_view source);

// Escapes `&`, `<` and `>` (and `"` when `in_attribute` is set).
[[nodiscard]] std::string escape_markup(
    const std::string_view source, const bool in_attribute = false);

// Markup of the children of `id`.
[[nodiscard]] std::string inner_markup(const node_tree& tree, const node_id id);

// Markup of `id` itself. Elements without children are written
// self-closed.
[[nodiscard]] std::string outer_markup(const node_tree& tree, const node_id id);

} // namespace prepress
