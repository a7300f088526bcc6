#include "protected_region.hpp"

#include "node_tree.hpp"
#include "tag.hpp"

namespace prepress {

namespace {

[[nodiscard]] bool opens_region(const tag t, const region r) noexcept
{
    switch (r)
    {
        case region::verbatim: return t == tag::pre || t == tag::code;
        case region::link: return t == tag::link;
    }

    return false;
}

} // namespace

tag tag_of(const node_tree& tree, const node_id id) noexcept
{
    if (!tree.is_element(id))
    {
        return tag::other;
    }

    return classify_tag(tree.name(id));
}

bool is_protected(
    const node_tree& tree, const node_id id, const region r) noexcept
{
    for (node_id curr = id; curr != null_node; curr = tree.parent(curr))
    {
        if (opens_region(tag_of(tree, curr), r))
        {
            return true;
        }
    }

    return false;
}

} // namespace prepress
