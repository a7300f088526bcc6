#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <prepress/markup.hpp>
#include <prepress/node_tree.hpp>

#include <string>
#include <vector>

using prepress::node_id;
using prepress::node_tree;
using prepress::null_node;

TEST_CASE("node_tree root")
{
    node_tree tree;

    REQUIRE(tree.size() == 1);
    REQUIRE(tree.is_element(tree.root()));
    REQUIRE(tree.parent(tree.root()) == null_node);
    REQUIRE(tree.children(tree.root()).empty());
}

TEST_CASE("node_tree append #0")
{
    node_tree tree;

    const node_id p = tree.create_element("p");
    const node_id text = tree.create_text("hello");

    REQUIRE(tree.append_child(p, text));
    REQUIRE(tree.append_child(tree.root(), p));

    REQUIRE(tree.parent(text) == p);
    REQUIRE(tree.parent(p) == tree.root());
    REQUIRE(tree.index_in_parent(text) == 0);
    REQUIRE(tree.text_content(tree.root()) == "hello");
    REQUIRE(prepress::inner_markup(tree, tree.root()) == "<p>hello</p>");
}

TEST_CASE("node_tree append #1")
{
    node_tree tree;

    const node_id a = tree.create_element("a");
    const node_id b = tree.create_element("b");

    REQUIRE(tree.append_child(tree.root(), a));
    REQUIRE(tree.append_child(a, b));

    // Already attached.
    REQUIRE(!tree.append_child(tree.root(), b));

    // Would create a cycle.
    REQUIRE(tree.detach(a));
    REQUIRE(!tree.append_child(b, a));
    REQUIRE(!tree.append_child(a, a));

    // The root never moves.
    REQUIRE(!tree.append_child(a, tree.root()));

    // Text nodes have no children.
    const node_id text = tree.create_text("x");
    REQUIRE(!tree.append_child(text, tree.create_text("y")));
}

TEST_CASE("node_tree insert_child")
{
    node_tree tree;

    const node_id a = tree.create_text("a");
    const node_id c = tree.create_text("c");
    const node_id b = tree.create_text("b");

    REQUIRE(tree.append_child(tree.root(), a));
    REQUIRE(tree.append_child(tree.root(), c));
    REQUIRE(tree.insert_child(tree.root(), 1, b));
    REQUIRE(!tree.insert_child(tree.root(), 10, tree.create_text("d")));

    REQUIRE(tree.text_content(tree.root()) == "abc");
}

TEST_CASE("node_tree replace_with")
{
    node_tree tree;

    const node_id old = tree.create_text("old");
    REQUIRE(tree.append_child(tree.root(), tree.create_text("<")));
    REQUIRE(tree.append_child(tree.root(), old));
    REQUIRE(tree.append_child(tree.root(), tree.create_text(">")));

    const std::vector<node_id> replacements{
        tree.create_text("n"), tree.create_element("br"), tree.create_text("w")};

    REQUIRE(tree.replace_with(old, replacements));
    REQUIRE(tree.parent(old) == null_node);

    for (const node_id r : replacements)
    {
        REQUIRE(tree.parent(r) == tree.root());
    }

    REQUIRE(prepress::inner_markup(tree, tree.root()) == "&lt;n<br/>w&gt;");
}

TEST_CASE("node_tree replace_with rejects duplicates")
{
    node_tree tree;

    const node_id old = tree.create_text("old");
    REQUIRE(tree.append_child(tree.root(), old));

    const node_id x = tree.create_text("x");
    const std::vector<node_id> replacements{x, x};

    REQUIRE(!tree.replace_with(old, replacements));
    REQUIRE(tree.parent(old) == tree.root());
    REQUIRE(tree.parent(x) == null_node);
}

TEST_CASE("node_tree wrap/unwrap")
{
    node_tree tree;

    const node_id text = tree.create_text("x");
    REQUIRE(tree.append_child(tree.root(), text));

    const auto wrapper = tree.wrap(text, "em");
    REQUIRE(wrapper.has_value());
    REQUIRE(tree.parent(text) == *wrapper);
    REQUIRE(prepress::inner_markup(tree, tree.root()) == "<em>x</em>");

    REQUIRE(tree.unwrap(*wrapper));
    REQUIRE(tree.parent(text) == tree.root());
    REQUIRE(prepress::inner_markup(tree, tree.root()) == "x");

    // Detached nodes cannot be wrapped.
    REQUIRE(!tree.wrap(tree.create_text("y"), "em").has_value());
}

TEST_CASE("node_tree unwrap")
{
    node_tree tree;
    REQUIRE(prepress::read_markup(tree, tree.root(), "a<b>x<i>y</i>z</b>c"));

    const node_id b = tree.children(tree.root())[1];
    REQUIRE(tree.unwrap(b));
    REQUIRE(tree.parent(b) == null_node);
    REQUIRE(tree.children(b).empty());
    REQUIRE(tree.children(tree.root()).size() == 5);
    REQUIRE(prepress::inner_markup(tree, tree.root()) == "ax<i>y</i>zc");

    // A detached element keeps its children when unwrapping is refused.
    const node_id loose = tree.create_element("em");
    const node_id inner = tree.create_text("w");
    REQUIRE(tree.append_child(loose, inner));

    REQUIRE(!tree.unwrap(loose));
    REQUIRE(tree.parent(inner) == loose);
    REQUIRE(tree.children(loose).size() == 1);

    REQUIRE(!tree.unwrap(tree.root()));
    REQUIRE(!tree.unwrap(inner));
}

TEST_CASE("node_tree descendants are a snapshot")
{
    node_tree tree;
    REQUIRE(prepress::read_markup(tree, tree.root(), "<p>a<b>b</b></p>c"));

    const std::vector<node_id> before = tree.descendants(tree.root());
    REQUIRE(before.size() == 5);
    REQUIRE(tree.name(before[0]) == "p");
    REQUIRE(tree.text(before[1]) == "a");
    REQUIRE(tree.name(before[2]) == "b");
    REQUIRE(tree.text(before[3]) == "b");
    REQUIRE(tree.text(before[4]) == "c");

    REQUIRE(tree.clear_children(tree.root()));
    REQUIRE(before.size() == 5);
    REQUIRE(tree.descendants(tree.root()).empty());
}

TEST_CASE("node_tree attributes")
{
    node_tree tree;

    const node_id link = tree.create_element("link");
    REQUIRE(!tree.attribute_value(link, "href").has_value());

    tree.set_attribute(link, "href", "a");
    tree.set_attribute(link, "href", "b");

    REQUIRE(tree.attributes(link).size() == 1);
    REQUIRE(tree.attribute_value(link, "href") == "b");
}
