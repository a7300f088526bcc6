#pragma once

#include "node_tree.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prepress {

enum class quote_direction : std::uint8_t
{
    opening,
    closing
};

// Opening if `before` is absent, whitespace, or opening punctuation.
[[nodiscard]] quote_direction get_quote_direction(
    const std::optional<char32_t> before) noexcept;

// Replaces straight quotes in `text` with directional ones. `before` is the
// code point just before `text`, if any. Directions are always decided on the
// unmodified input.
[[nodiscard]] std::u32string resolve_quotes(
    const std::u32string_view text, const std::optional<char32_t> before);

// Resolves the quotes of every text node under a root that is neither
// verbatim nor part of a link.
//
// The text-node sequence and its original content are captured on
// construction; each node then borrows the last code point of the previous
// non-empty node, so a quote right after an element boundary resolves as if
// the boundary was not there. Skipped nodes still lend their code points.
class quote_resolver
{
private:
    std::vector<node_id> _nodes;
    std::vector<std::u32string> _original;
    std::vector<bool> _skipped;

    [[nodiscard]] std::optional<char32_t> borrow_before(
        const std::size_t index) const noexcept;

public:
    [[nodiscard]] explicit quote_resolver(
        const node_tree& tree, const node_id root);

    // Writes the resolved content back. Verbatim and link nodes are left
    // untouched.
    void apply(node_tree& tree) const;
};

} // namespace prepress
