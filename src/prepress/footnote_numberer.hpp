#pragma once

#include "node_tree.hpp"

#include <cstddef>
#include <limits>
#include <optional>

namespace prepress {

// Running footnote counter for one article.
//
// Empty markers take the expected number. Explicit markers keep their own
// number; one at or past the expected number moves the sequence on to follow
// it, while a lower one (citing an earlier footnote again) leaves it alone.
class footnote_numberer
{
private:
    std::size_t _expected;

public:
    [[nodiscard]] explicit footnote_numberer() noexcept : _expected{1}
    {}

    [[nodiscard]] std::size_t expected() const noexcept
    {
        return _expected;
    }

    // Returns the number to display for a marker.
    [[nodiscard]] std::size_t next(
        const std::optional<std::size_t> explicit_number) noexcept
    {
        const std::size_t number = explicit_number.value_or(_expected);

        if (number >= _expected &&
            number != std::numeric_limits<std::size_t>::max())
        {
            _expected = number + 1;
        }

        return number;
    }
};

// Replaces `[]` / `[<digits>]` markers outside verbatim regions with `sup`
// elements holding the resolved number. Returns `false` if the tree refused a
// splice.
[[nodiscard]] bool number_footnotes(node_tree& tree, const node_id root);

} // namespace prepress
