#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace prepress {

using node_id = std::uint32_t;

inline constexpr node_id null_node = static_cast<node_id>(-1);

enum class node_kind : std::uint8_t
{
    element,
    text
};

struct attribute
{
    std::string _name;
    std::string _value;
};

// Arena-backed document tree. Nodes are addressed by `node_id`; a node's
// `parent` is a plain id and its children are an ordered id sequence owned by
// the arena. Detached nodes stay in the arena until the tree is destroyed.
class node_tree
{
private:
    struct node
    {
        node_kind _kind;
        std::string _data; // tag name or text payload
        std::vector<attribute> _attributes;
        std::vector<node_id> _children;
        node_id _parent;
    };

    std::vector<node> _nodes;
    node_id _root;

    [[nodiscard]] node& at(const node_id id) noexcept;
    [[nodiscard]] const node& at(const node_id id) const noexcept;

    [[nodiscard]] bool can_attach(
        const node_id parent, const node_id child) const noexcept;

public:
    [[nodiscard]] explicit node_tree();

    [[nodiscard]] node_id root() const noexcept;
    [[nodiscard]] bool contains(const node_id id) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] node_id create_element(const std::string_view name);
    [[nodiscard]] node_id create_text(const std::string_view text);

    [[nodiscard]] node_kind kind(const node_id id) const noexcept;
    [[nodiscard]] bool is_element(const node_id id) const noexcept;
    [[nodiscard]] bool is_text(const node_id id) const noexcept;

    [[nodiscard]] const std::string& name(const node_id id) const noexcept;
    void rename(const node_id id, const std::string_view name);

    [[nodiscard]] const std::string& text(const node_id id) const noexcept;
    void set_text(const node_id id, const std::string_view text);

    [[nodiscard]] const std::vector<attribute>& attributes(
        const node_id id) const noexcept;

    [[nodiscard]] std::optional<std::string_view> attribute_value(
        const node_id id, const std::string_view name) const noexcept;

    void set_attribute(const node_id id, const std::string_view name,
        const std::string_view value);

    [[nodiscard]] node_id parent(const node_id id) const noexcept;

    [[nodiscard]] const std::vector<node_id>& children(
        const node_id id) const noexcept;

    [[nodiscard]] std::optional<std::size_t> index_in_parent(
        const node_id id) const noexcept;

    [[nodiscard]] bool is_ancestor_of(
        const node_id ancestor, const node_id id) const noexcept;

    //
    // Mutation. Every operation returns `false` (and leaves the tree
    // untouched) if it would attach an already-attached node, attach a node
    // under its own descendant, or address a node that does not exist.
    // ------------------------------------------------------------------------
    [[nodiscard]] bool insert_child(
        const node_id parent, const std::size_t index, const node_id child);

    [[nodiscard]] bool append_child(const node_id parent, const node_id child);

    [[nodiscard]] bool detach(const node_id id);

    [[nodiscard]] bool replace_with(
        const node_id id, const std::span<const node_id> replacements);

    [[nodiscard]] std::optional<node_id> wrap(
        const node_id id, const std::string_view wrapper_name);

    [[nodiscard]] bool unwrap(const node_id id);

    [[nodiscard]] bool clear_children(const node_id id);

    //
    // Traversal. All traversals return snapshots in document order, so
    // callers are free to mutate the tree while walking the result.
    // ------------------------------------------------------------------------
    [[nodiscard]] std::vector<node_id> descendants(const node_id id) const;

    [[nodiscard]] std::vector<node_id> text_nodes(const node_id id) const;

    [[nodiscard]] std::string text_content(const node_id id) const;
};

} // namespace prepress
