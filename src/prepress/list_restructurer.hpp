#pragma once

#include "node_tree.hpp"
#include "tag.hpp"

#include <cstddef>

namespace prepress {

inline constexpr std::size_t max_unordered_list_depth = 5;
inline constexpr std::size_t max_ordered_list_depth = 3;

// Number of same-family list ancestors of `list_id`, plus one. `ul`..`ul5`
// count for unordered lists, `ol`..`ol3` for ordered ones.
[[nodiscard]] std::size_t list_depth(
    const node_tree& tree, const node_id list_id, const tag family) noexcept;

// Tag for a list of `family` (`tag::ul` or `tag::ol`) at `depth`, clamped to
// the deepest supported variant.
[[nodiscard]] tag list_tag_for_depth(
    const tag family, const std::size_t depth) noexcept;

// Flattens lists for the layout importer, which knows neither `li` nor
// nested lists:
//
// - every `li` of a `ul`, `ol` or `profquotes` is unwrapped in place, bare
//   text between items is dropped and a `\n` paragraph break follows every
//   item but the last;
// - nested lists are renamed after their depth (`ul2`..`ul5`, `ol2`..`ol3`);
// - the first child of a top-level `ul`/`ol` is wrapped in
//   `ul_first`/`ol_first`.
//
// Returns `false` if the tree refused a mutation.
[[nodiscard]] bool restructure_lists(node_tree& tree, const node_id root);

} // namespace prepress
