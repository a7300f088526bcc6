#include "text_scan.hpp"

#include "node_tree.hpp"
#include "protected_region.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <cstddef>

namespace prepress {

std::vector<node_id> unprotected_text_nodes(
    const node_tree& tree, const node_id root, const region r)
{
    std::vector<node_id> result;

    for (const node_id id : tree.text_nodes(root))
    {
        if (!is_protected(tree, id, r))
        {
            result.push_back(id);
        }
    }

    return result;
}

void replace_all(
    std::string& target, const std::string_view from, const std::string_view to)
{
    if (from.empty())
    {
        return;
    }

    std::size_t pos = 0;
    while ((pos = target.find(from, pos)) != std::string::npos)
    {
        target.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace prepress
