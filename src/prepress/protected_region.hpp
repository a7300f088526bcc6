#pragma once

#include "node_tree.hpp"
#include "tag.hpp"

#include <cstdint>

namespace prepress {

enum class region : std::uint8_t
{
    // `pre` and `code`: no text substitution at all
    verbatim,

    // `link`: no punctuation normalization
    link
};

// Tag of an element node, `tag::other` for text nodes.
[[nodiscard]] tag tag_of(const node_tree& tree, const node_id id) noexcept;

// True if `id` or any of its ancestors opens a protected `r` region.
[[nodiscard]] bool is_protected(
    const node_tree& tree, const node_id id, const region r) noexcept;

} // namespace prepress
