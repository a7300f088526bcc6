#include "span_splicer.hpp"

#include "node_tree.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace prepress {

std::optional<node_id> splice(node_tree& tree, const node_id text_id,
    const std::size_t begin, const std::size_t end, const node_id replacement)
{
    if (!tree.is_text(text_id) || !tree.contains(replacement))
    {
        return std::nullopt;
    }

    if (tree.parent(text_id) == null_node ||
        tree.parent(replacement) != null_node || replacement == tree.root())
    {
        return std::nullopt;
    }

    // Copy: creating nodes below may reallocate the arena.
    const std::string content = tree.text(text_id);

    if (begin > end || end > content.size())
    {
        return std::nullopt;
    }

    std::vector<node_id> pieces;
    pieces.reserve(3);

    if (begin > 0)
    {
        pieces.push_back(tree.create_text(content.substr(0, begin)));
    }

    pieces.push_back(replacement);

    node_id suffix = null_node;
    if (end < content.size())
    {
        suffix = tree.create_text(content.substr(end));
        pieces.push_back(suffix);
    }

    if (!tree.replace_with(text_id, pieces))
    {
        return std::nullopt;
    }

    return {suffix};
}

} // namespace prepress
