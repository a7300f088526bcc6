#pragma once

#include "node_tree.hpp"

#include <cstddef>
#include <optional>

namespace prepress {

// Replaces `[begin, end)` of the text node `text_id` with `replacement`.
//
// The text node is replaced in its parent, in order, by the prefix text (if
// non-empty), `replacement`, and the suffix text (if non-empty). The consumed
// range is discarded. A zero-length range inserts `replacement` in place.
//
// Returns the suffix text node, or `null_node` if the suffix is empty, so the
// caller can keep scanning the original string after the match. Returns
// `std::nullopt` if the splice would break the tree: `text_id` is not an
// attached text node, the range is out of bounds, or `replacement` is
// already attached somewhere.
[[nodiscard]] std::optional<node_id> splice(node_tree& tree,
    const node_id text_id, const std::size_t begin, const std::size_t end,
    const node_id replacement);

} // namespace prepress
