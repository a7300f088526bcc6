#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <prepress/footnote_numberer.hpp>
#include <prepress/markup.hpp>
#include <prepress/node_tree.hpp>

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace {

[[nodiscard]] std::string number(const std::string_view source)
{
    prepress::node_tree tree;
    REQUIRE(prepress::read_markup(tree, tree.root(), source));
    REQUIRE(prepress::number_footnotes(tree, tree.root()));
    return prepress::inner_markup(tree, tree.root());
}

} // namespace

TEST_CASE("footnote_numberer sequence")
{
    prepress::footnote_numberer numberer;

    REQUIRE(numberer.expected() == 1);
    REQUIRE(numberer.next(1) == 1);
    REQUIRE(numberer.next(std::nullopt) == 2);
    REQUIRE(numberer.next(std::nullopt) == 3);
    REQUIRE(numberer.next(5) == 5);
    REQUIRE(numberer.expected() == 6);
    REQUIRE(numberer.next(std::nullopt) == 6);
}

TEST_CASE("footnote_numberer earlier footnote cited again")
{
    prepress::footnote_numberer numberer;

    REQUIRE(numberer.next(std::nullopt) == 1);
    REQUIRE(numberer.next(std::nullopt) == 2);
    REQUIRE(numberer.next(1) == 1);
    REQUIRE(numberer.expected() == 3);
    REQUIRE(numberer.next(std::nullopt) == 3);
}

TEST_CASE("number_footnotes #0")
{
    REQUIRE(number("a[1] b[] c[] d[5] e[]") ==
            "a<sup>1</sup> b<sup>2</sup> c<sup>3</sup> d<sup>5</sup> e<sup>6</sup>");
}

TEST_CASE("number_footnotes #1")
{
    // The counter runs across text nodes and skips verbatim regions.
    REQUIRE(number("x[] <em>y[]</em> <code>z[]</code> w[]") ==
            "x<sup>1</sup> <em>y<sup>2</sup></em> <code>z[]</code> w<sup>3</sup>");
}

TEST_CASE("number_footnotes #2")
{
    // Markers that do not fit a number stay literal.
    REQUIRE(number("a[99999999999999999999999] b[]") ==
            "a[99999999999999999999999] b<sup>1</sup>");

    REQUIRE(number("[x] [ 1]") == "[x] [ 1]");
}

TEST_CASE("number_footnotes #3")
{
    REQUIRE(number("a[18446744073709551615] b[] c[]") ==
            "a[18446744073709551615] b<sup>1</sup> c<sup>2</sup>");
}

TEST_CASE("footnote_numberer largest number")
{
    prepress::footnote_numberer numberer;

    const std::size_t largest = std::numeric_limits<std::size_t>::max();
    REQUIRE(numberer.next(largest) == largest);
    REQUIRE(numberer.expected() == 1);
}
