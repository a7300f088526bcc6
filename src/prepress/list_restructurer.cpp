#include "list_restructurer.hpp"

#include "node_tree.hpp"
#include "protected_region.hpp"
#include "tag.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

namespace prepress {

namespace {

[[nodiscard]] bool is_same_family(const tag t, const tag family) noexcept
{
    return family == tag::ul ? is_unordered_list_tag(t)
                             : is_ordered_list_tag(t);
}

[[nodiscard]] bool flatten_list(node_tree& tree, const node_id list_id)
{
    const std::vector<node_id> items = tree.children(list_id);

    if (!tree.clear_children(list_id))
    {
        return false;
    }

    std::vector<node_id> flattened;
    flattened.reserve(items.size() * 2);

    for (const node_id child : items)
    {
        if (tree.is_text(child))
        {
            continue;
        }

        if (tag_of(tree, child) == tag::li)
        {
            const std::vector<node_id> contents = tree.children(child);

            if (!tree.clear_children(child))
            {
                return false;
            }

            flattened.insert(flattened.end(), contents.begin(), contents.end());
        }
        else
        {
            flattened.push_back(child);
        }

        flattened.push_back(tree.create_text("\n"));
    }

    if (!flattened.empty())
    {
        flattened.pop_back();
    }

    for (const node_id child : flattened)
    {
        if (!tree.append_child(list_id, child))
        {
            return false;
        }
    }

    return true;
}

[[nodiscard]] bool assign_depths(
    node_tree& tree, const node_id root, const tag family)
{
    const tag first_marker = family == tag::ul ? tag::ul_first : tag::ol_first;

    for (const node_id id : tree.descendants(root))
    {
        if (tag_of(tree, id) != family)
        {
            continue;
        }

        const std::size_t depth = list_depth(tree, id, family);

        if (depth > 1)
        {
            tree.rename(id, tag_name(list_tag_for_depth(family, depth)));
            continue;
        }

        if (tree.children(id).empty())
        {
            continue;
        }

        if (!tree.wrap(tree.children(id).front(), tag_name(first_marker))
                 .has_value())
        {
            return false;
        }
    }

    return true;
}

} // namespace

std::size_t list_depth(
    const node_tree& tree, const node_id list_id, const tag family) noexcept
{
    std::size_t depth = 1;

    for (node_id curr = tree.parent(list_id); curr != null_node;
         curr = tree.parent(curr))
    {
        if (is_same_family(tag_of(tree, curr), family))
        {
            ++depth;
        }
    }

    return depth;
}

tag list_tag_for_depth(const tag family, const std::size_t depth) noexcept
{
    if (family == tag::ul)
    {
        switch (std::min(depth, max_unordered_list_depth))
        {
            case 0:
            case 1: return tag::ul;
            case 2: return tag::ul2;
            case 3: return tag::ul3;
            case 4: return tag::ul4;
            default: return tag::ul5;
        }
    }

    switch (std::min(depth, max_ordered_list_depth))
    {
        case 0:
        case 1: return tag::ol;
        case 2: return tag::ol2;
        default: return tag::ol3;
    }
}

bool restructure_lists(node_tree& tree, const node_id root)
{
    for (const node_id id : tree.descendants(root))
    {
        switch (tag_of(tree, id))
        {
            case tag::ul:
            case tag::ol:
            case tag::profquotes:
                if (!flatten_list(tree, id))
                {
                    return false;
                }
                break;

            default: break;
        }
    }

    return assign_depths(tree, root, tag::ul) &&
           assign_depths(tree, root, tag::ol);
}

} // namespace prepress
