#include "node_tree.hpp"

#include <algorithm>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cassert>
#include <cstddef>

namespace prepress {

node_tree::node& node_tree::at(const node_id id) noexcept
{
    assert(contains(id));
    return _nodes[id];
}

const node_tree::node& node_tree::at(const node_id id) const noexcept
{
    assert(contains(id));
    return _nodes[id];
}

bool node_tree::can_attach(
    const node_id parent, const node_id child) const noexcept
{
    if (!contains(parent) || !contains(child))
    {
        return false;
    }

    if (!is_element(parent) || child == _root || child == parent)
    {
        return false;
    }

    // Attaching an ancestor of `parent` would close a cycle.
    return at(child)._parent == null_node && !is_ancestor_of(child, parent);
}

node_tree::node_tree() : _root{0}
{
    _nodes.reserve(64);
    _nodes.push_back(node{._kind = node_kind::element,
        ._data = "[document]",
        ._attributes = {},
        ._children = {},
        ._parent = null_node});
}

node_id node_tree::root() const noexcept
{
    return _root;
}

bool node_tree::contains(const node_id id) const noexcept
{
    return id < _nodes.size();
}

std::size_t node_tree::size() const noexcept
{
    return _nodes.size();
}

node_id node_tree::create_element(const std::string_view name)
{
    _nodes.push_back(node{._kind = node_kind::element,
        ._data = std::string{name},
        ._attributes = {},
        ._children = {},
        ._parent = null_node});

    return static_cast<node_id>(_nodes.size() - 1);
}

node_id node_tree::create_text(const std::string_view text)
{
    _nodes.push_back(node{._kind = node_kind::text,
        ._data = std::string{text},
        ._attributes = {},
        ._children = {},
        ._parent = null_node});

    return static_cast<node_id>(_nodes.size() - 1);
}

node_kind node_tree::kind(const node_id id) const noexcept
{
    return at(id)._kind;
}

bool node_tree::is_element(const node_id id) const noexcept
{
    return contains(id) && at(id)._kind == node_kind::element;
}

bool node_tree::is_text(const node_id id) const noexcept
{
    return contains(id) && at(id)._kind == node_kind::text;
}

const std::string& node_tree::name(const node_id id) const noexcept
{
    assert(is_element(id));
    return at(id)._data;
}

void node_tree::rename(const node_id id, const std::string_view name)
{
    assert(is_element(id));
    at(id)._data = name;
}

const std::string& node_tree::text(const node_id id) const noexcept
{
    assert(is_text(id));
    return at(id)._data;
}

void node_tree::set_text(const node_id id, const std::string_view text)
{
    assert(is_text(id));
    at(id)._data = text;
}

const std::vector<attribute>& node_tree::attributes(
    const node_id id) const noexcept
{
    return at(id)._attributes;
}

std::optional<std::string_view> node_tree::attribute_value(
    const node_id id, const std::string_view name) const noexcept
{
    for (const attribute& attr : at(id)._attributes)
    {
        if (attr._name == name)
        {
            return {attr._value};
        }
    }

    return std::nullopt;
}

void node_tree::set_attribute(
    const node_id id, const std::string_view name, const std::string_view value)
{
    assert(is_element(id));

    for (attribute& attr : at(id)._attributes)
    {
        if (attr._name == name)
        {
            attr._value = value;
            return;
        }
    }

    at(id)._attributes.push_back(
        attribute{._name = std::string{name}, ._value = std::string{value}});
}

node_id node_tree::parent(const node_id id) const noexcept
{
    return at(id)._parent;
}

const std::vector<node_id>& node_tree::children(
    const node_id id) const noexcept
{
    return at(id)._children;
}

std::optional<std::size_t> node_tree::index_in_parent(
    const node_id id) const noexcept
{
    const node_id p = parent(id);
    if (p == null_node)
    {
        return std::nullopt;
    }

    const std::vector<node_id>& siblings = at(p)._children;
    const auto it = std::find(siblings.begin(), siblings.end(), id);

    if (it == siblings.end())
    {
        return std::nullopt;
    }

    return {static_cast<std::size_t>(it - siblings.begin())};
}

bool node_tree::is_ancestor_of(
    const node_id ancestor, const node_id id) const noexcept
{
    for (node_id curr = parent(id); curr != null_node; curr = parent(curr))
    {
        if (curr == ancestor)
        {
            return true;
        }
    }

    return false;
}

bool node_tree::insert_child(
    const node_id parent, const std::size_t index, const node_id child)
{
    if (!can_attach(parent, child))
    {
        return false;
    }

    std::vector<node_id>& siblings = at(parent)._children;
    if (index > siblings.size())
    {
        return false;
    }

    siblings.insert(siblings.begin() + static_cast<std::ptrdiff_t>(index), child);
    at(child)._parent = parent;
    return true;
}

bool node_tree::append_child(const node_id parent, const node_id child)
{
    if (!contains(parent))
    {
        return false;
    }

    return insert_child(parent, at(parent)._children.size(), child);
}

bool node_tree::detach(const node_id id)
{
    if (!contains(id))
    {
        return false;
    }

    const std::optional<std::size_t> idx = index_in_parent(id);
    if (!idx.has_value())
    {
        return false;
    }

    std::vector<node_id>& siblings = at(parent(id))._children;
    siblings.erase(siblings.begin() + static_cast<std::ptrdiff_t>(*idx));
    at(id)._parent = null_node;
    return true;
}

bool node_tree::replace_with(
    const node_id id, const std::span<const node_id> replacements)
{
    if (!contains(id))
    {
        return false;
    }

    const node_id p = parent(id);
    const std::optional<std::size_t> idx = index_in_parent(id);

    if (!idx.has_value())
    {
        return false;
    }

    for (std::size_t i = 0; i < replacements.size(); ++i)
    {
        const node_id r = replacements[i];

        if (r == id || !can_attach(p, r))
        {
            return false;
        }

        if (std::find(replacements.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                replacements.end(), r) != replacements.end())
        {
            return false;
        }
    }

    std::vector<node_id>& siblings = at(p)._children;
    siblings.erase(siblings.begin() + static_cast<std::ptrdiff_t>(*idx));
    siblings.insert(siblings.begin() + static_cast<std::ptrdiff_t>(*idx),
        replacements.begin(), replacements.end());

    for (const node_id r : replacements)
    {
        at(r)._parent = p;
    }

    at(id)._parent = null_node;
    return true;
}

std::optional<node_id> node_tree::wrap(
    const node_id id, const std::string_view wrapper_name)
{
    if (!contains(id) || parent(id) == null_node)
    {
        return std::nullopt;
    }

    const node_id wrapper = create_element(wrapper_name);
    const node_id single[]{wrapper};

    if (!replace_with(id, single) || !append_child(wrapper, id))
    {
        return std::nullopt;
    }

    return {wrapper};
}

bool node_tree::unwrap(const node_id id)
{
    const std::optional<std::size_t> idx = index_in_parent(id);
    if (!is_element(id) || !idx.has_value())
    {
        return false;
    }

    // The children already hang off the tree, so moving them up one level
    // cannot fail once `id` is known to have a parent.
    const node_id p = parent(id);
    const std::vector<node_id> moved = std::move(at(id)._children);
    at(id)._children.clear();

    std::vector<node_id>& siblings = at(p)._children;
    siblings.erase(siblings.begin() + static_cast<std::ptrdiff_t>(*idx));
    siblings.insert(siblings.begin() + static_cast<std::ptrdiff_t>(*idx),
        moved.begin(), moved.end());

    for (const node_id child : moved)
    {
        at(child)._parent = p;
    }

    at(id)._parent = null_node;
    return true;
}

bool node_tree::clear_children(const node_id id)
{
    if (!is_element(id))
    {
        return false;
    }

    for (const node_id child : at(id)._children)
    {
        at(child)._parent = null_node;
    }

    at(id)._children.clear();
    return true;
}

std::vector<node_id> node_tree::descendants(const node_id id) const
{
    std::vector<node_id> result;
    std::vector<node_id> stack(
        at(id)._children.rbegin(), at(id)._children.rend());

    while (!stack.empty())
    {
        const node_id curr = stack.back();
        stack.pop_back();

        result.push_back(curr);

        const std::vector<node_id>& kids = at(curr)._children;
        stack.insert(stack.end(), kids.rbegin(), kids.rend());
    }

    return result;
}

std::vector<node_id> node_tree::text_nodes(const node_id id) const
{
    std::vector<node_id> result;

    for (const node_id n : descendants(id))
    {
        if (is_text(n))
        {
            result.push_back(n);
        }
    }

    return result;
}

std::string node_tree::text_content(const node_id id) const
{
    if (is_text(id))
    {
        return at(id)._data;
    }

    std::string result;

    for (const node_id n : text_nodes(id))
    {
        result.append(at(n)._data);
    }

    return result;
}

} // namespace prepress
