#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <prepress/article.hpp>
#include <prepress/collaborators.hpp>
#include <prepress/diagnostics.hpp>
#include <prepress/markup.hpp>
#include <prepress/node_tree.hpp>
#include <prepress/passes.hpp>
#include <prepress/pipeline.hpp>

#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;

namespace {

// UTF-8 spellings used in expectations. Kept as separate literals so that
// hex escapes never run into the text that follows them.
#define LDQ "\xE2\x80\x9C"
#define RDQ "\xE2\x80\x9D"
#define RSQ "\xE2\x80\x99"
#define LSEP "\xE2\x80\xA8"
#define ELLIPSIS "\xE2\x80\xA6"
#define EN_DASH "\xE2\x80\x93"
#define EM_DASH "\xE2\x80\x94"
#define HAIR "\xE2\x80\x8A"
#define NBSP "\xC2\xA0"

class test_collaborators : public prepress::collaborators
{
public:
    std::map<std::string, std::string, std::less<>> _resources;
    std::map<std::string, std::string, std::less<>> _stored;
    std::vector<std::string> _fetched;
    std::vector<std::string> _math_sources;
    std::vector<bool> _math_display;
    std::vector<prepress::code_options> _highlighted;

    bool _math_fails = false;
    bool _highlight_fails = false;
    bool _highlight_changes_text = false;

    [[nodiscard]] std::optional<error> fetch_resource(
        std::string& output_buffer, const std::string_view url) override
    {
        _fetched.emplace_back(url);

        const auto it = _resources.find(url);
        if (it == _resources.end())
        {
            return error{._reason = "404"};
        }

        output_buffer = it->second;
        return std::nullopt;
    }

    [[nodiscard]] std::optional<error> store_asset(
        const std::string_view path, const std::string_view bytes) override
    {
        _stored.emplace(std::string{path}, std::string{bytes});
        return std::nullopt;
    }

    [[nodiscard]] std::optional<error> compile_math(std::string& output_path,
        const std::string_view source, const bool display_mode,
        const std::string_view artifact_stem) override
    {
        _math_sources.emplace_back(source);
        _math_display.push_back(display_mode);

        if (_math_fails)
        {
            return error{._reason = "pdflatex failed"};
        }

        output_path = artifact_stem;
        output_path.append(".pdf");
        return std::nullopt;
    }

    [[nodiscard]] std::optional<error> highlight_code(
        std::string& output_markup, const std::string_view source,
        const prepress::code_options& options) override
    {
        _highlighted.push_back(options);

        if (_highlight_fails)
        {
            return error{._reason = "unknown language"};
        }

        output_markup = R"(<span class="hl">)";
        output_markup.append(prepress::escape_markup(source));
        output_markup.append(_highlight_changes_text ? "!" : "");
        output_markup.append("</span>");
        return std::nullopt;
    }
};

struct test_env
{
    std::ostringstream _err;
    test_collaborators _collaborators;
    prepress::pipeline::config _cfg;
    prepress::article _article;

    test_env()
    {
        _article._title = "Hello World, again";
        _article._id = "42";
    }

    [[nodiscard]] std::string run(
        const prepress::pass_fn fn, const std::string_view source)
    {
        REQUIRE(prepress::read_markup(
            _article._content, _article._content.root(), source));

        prepress::diagnostics diag{_err, _article._id};
        prepress::pass_context ctx{._config = _cfg,
            ._collaborators = _collaborators,
            ._diagnostics = diag};

        REQUIRE(fn(_article, ctx));
        return prepress::inner_markup(_article._content, _article._content.root());
    }
};

[[nodiscard]] std::string run_pass(
    const prepress::pass_fn fn, const std::string_view source)
{
    test_env env;
    return env.run(fn, source);
}

} // namespace

TEST_CASE("pass catalog order")
{
    const auto catalog = prepress::pass_catalog();
    REQUIRE(catalog.size() == 21);

    const auto index_of = [&](const std::string_view name)
    {
        for (std::size_t i = 0; i < catalog.size(); ++i)
        {
            if (catalog[i]._name == name)
            {
                return i;
            }
        }

        FAIL("missing pass");
        return catalog.size();
    };

    REQUIRE(catalog.front()._name == "captions"sv);
    REQUIRE(catalog.back()._name == "lists"sv);

    REQUIRE(index_of("captions") < index_of("normalize newlines"));
    REQUIRE(index_of("inline code") < index_of("code blocks"));
    REQUIRE(index_of("punctuation in quotes") < index_of("footnotes"));
    REQUIRE(index_of("footnote after punctuation") < index_of("footnotes"));
    REQUIRE(index_of("quotes") < index_of("emphasis collapse"));
}

TEST_CASE("captions #0")
{
    REQUIRE(run_pass(&prepress::process_captions,
                R"(<caption id="c"><img src="a.png"> A caption</caption>)") ==
            R"(<img src="a.png"/><figcaption>A caption</figcaption>)");
}

TEST_CASE("captions #1")
{
    REQUIRE(run_pass(&prepress::process_captions,
                R"(x<caption><a href="l"><img src="b.png"></a> Text <em>e</em></caption>y)") ==
            R"(x<a href="l"><img src="b.png"/></a><figcaption>Text <em>e</em></figcaption>y)");

    REQUIRE(run_pass(&prepress::process_captions, "<caption> </caption>") ==
            "<figcaption/>");
}

TEST_CASE("normalize newlines")
{
    REQUIRE(run_pass(&prepress::normalize_newlines, "a\r\nb<pre>c\r\n</pre>") ==
            "a\nb<pre>c\n</pre>");
}

TEST_CASE("imgur embeds #0")
{
    REQUIRE(run_pass(&prepress::convert_imgur_embeds,
                "see [embed]https://imgur.com/abcdefg.png[/embed] now") ==
            R"(see <img src="https://i.imgur.com/abcdefg.png"/> now)");

    REQUIRE(run_pass(&prepress::convert_imgur_embeds,
                "<code>[embed]https://imgur.com/abcdefg.png[/embed]</code>") ==
            "<code>[embed]https://imgur.com/abcdefg.png[/embed]</code>");
}

TEST_CASE("imgur embeds #1")
{
    test_env env;
    env._collaborators._resources.emplace(
        "https://imgur.com/a/abcde/embed?pub=true",
        R"(<html><div id="image"><img class="post big" src="//i.imgur.com/zyxwv.jpg?1"></div></html>)");

    REQUIRE(env.run(&prepress::convert_imgur_embeds,
                "[embed]https://imgur.com/a/abcde[/embed]") ==
            R"(<img src="https://i.imgur.com/zyxwv.jpg"/>)");

    REQUIRE(env._err.str().empty());
}

TEST_CASE("imgur embeds #2")
{
    test_env env;

    REQUIRE(env.run(&prepress::convert_imgur_embeds,
                "[embed]https://imgur.com/gallery/abcde[/embed]") ==
            "[embed]https://imgur.com/gallery/abcde[/embed]");

    REQUIRE(env._collaborators._fetched ==
            std::vector<std::string>{
                "https://imgur.com/gallery/abcde/embed?pub=true"});

    REQUIRE(env._err.str() ==
            "((FETCH ERROR))(42): Error downloading Imgur gallery "
            "'[embed]https://imgur.com/gallery/abcde[/embed]' (404)\n\n");
}

TEST_CASE("imgur embeds #3")
{
    test_env env;
    env._cfg.skip_embeds = true;

    REQUIRE(env.run(&prepress::convert_imgur_embeds,
                "[embed]https://imgur.com/abcdefg.png[/embed]") ==
            "[embed]https://imgur.com/abcdefg.png[/embed]");
}

TEST_CASE("download images")
{
    test_env env;
    env._collaborators._resources.emplace("https://e.com/pics/a.png?s=1", "A");
    env._collaborators._resources.emplace("https://e.com/c.gif", "C");

    const std::string result = env.run(&prepress::download_images,
        R"(<img src="https://e.com/pics/a.png?s=1"><img><img src="https://e.com/missing.png"><img src="https://e.com/c.gif">)");

    REQUIRE(result ==
            R"(<link src="https://e.com/pics/a.png?s=1" href="file://assets/img/Hello_Worl_42_000_a.png"/>)"
            R"(<img/>)"
            R"(<img src="https://e.com/missing.png"/>)"
            R"(<link src="https://e.com/c.gif" href="file://assets/img/Hello_Worl_42_003_c.gif"/>)");

    REQUIRE(env._collaborators._stored.size() == 2);
    REQUIRE(env._collaborators._stored.at("assets/img/Hello_Worl_42_000_a.png") == "A");
    REQUIRE(env._collaborators._stored.at("assets/img/Hello_Worl_42_003_c.gif") == "C");

    REQUIRE(env._err.str() ==
            "((FETCH ERROR))(42): Error downloading image "
            "'https://e.com/missing.png' (404)\n\n");
}

TEST_CASE("compile latex #0")
{
    test_env env;

    const std::string result = env.run(
        &prepress::compile_latex, R"(Area \(x^2\), then \[y\] and \(x^2\).)");

    REQUIRE(env._collaborators._math_sources == std::vector<std::string>{"x^2", "y"});
    REQUIRE(env._collaborators._math_display == std::vector<bool>{false, true});

    const prepress::node_tree& tree = env._article._content;
    const auto& kids = tree.children(tree.root());

    REQUIRE(kids.size() == 7);
    REQUIRE(tree.text(kids[0]) == "Area ");
    REQUIRE(tree.name(kids[1]) == "link");
    REQUIRE(tree.text(kids[2]) == ", then ");
    REQUIRE(tree.name(kids[3]) == "link");
    REQUIRE(tree.text(kids[4]) == " and ");
    REQUIRE(tree.name(kids[5]) == "link");
    REQUIRE(tree.text(kids[6]) == ".");

    const std::string_view inline_href = *tree.attribute_value(kids[1], "href");
    const std::string_view display_href = *tree.attribute_value(kids[3], "href");

    REQUIRE(inline_href.starts_with("file://assets/pdf/Hello_Worl_42_"));
    REQUIRE(inline_href.ends_with(".pdf"));
    REQUIRE(inline_href != display_href);
    REQUIRE(tree.attribute_value(kids[5], "href") == inline_href);

    REQUIRE(env._err.str().empty());
}

TEST_CASE("compile latex #1")
{
    test_env env;
    env._collaborators._math_fails = true;

    REQUIRE(env.run(&prepress::compile_latex, R"(\(bad\) \[bad\] <pre>\(x\)</pre>)") ==
            R"(\(bad\) \[bad\] <pre>\(x\)</pre>)");

    // Invalid sources are not retried, whatever the delimiters.
    REQUIRE(env._collaborators._math_sources == std::vector<std::string>{"bad"});

    REQUIRE(env._err.str() ==
            "((MATH ERROR))(42): Could not compile '\\(bad\\)' (pdflatex "
            "failed)\n\n");
}

TEST_CASE("inline code")
{
    REQUIRE(run_pass(&prepress::replace_inline_code, "use `ls -l` or `x`.") ==
            "use <code>ls -l</code> or <code>x</code>.");

    REQUIRE(run_pass(&prepress::replace_inline_code, "<pre>`a`</pre> `unclosed") ==
            "<pre>`a`</pre> `unclosed");
}

TEST_CASE("manual highlighting")
{
    REQUIRE(run_pass(&prepress::convert_manual_highlighting,
                "<pre><b>k</b><em>i</em><u>u</u></pre><b>out</b>") ==
            "<pre><hl_bold>k</hl_bold><hl_italic>i</hl_italic>"
            "<hl_underline>u</hl_underline></pre><b>out</b>");

    REQUIRE(run_pass(&prepress::convert_manual_highlighting,
                "<code><strong>s</strong><i>t</i></code>") ==
            "<code><hl_bold>s</hl_bold><hl_italic>t</hl_italic></code>");
}

TEST_CASE("code blocks #0")
{
    REQUIRE(run_pass(&prepress::format_code_blocks, "<pre>int x;</pre>") ==
            "<pre><code>int x;</code></pre>");

    REQUIRE(run_pass(&prepress::format_code_blocks, "<pre><code>y</code></pre>") ==
            "<pre><code>y</code></pre>");

    REQUIRE(run_pass(&prepress::format_code_blocks, "<pre></pre>") ==
            "<pre><code/></pre>");
}

TEST_CASE("code blocks #1")
{
    test_env env;

    REQUIRE(env.run(&prepress::format_code_blocks,
                "<pre>:lang: cpp\n:linenos:\n\na\nb\n</pre>") ==
            "<pre><code><lineno n=\"1\"/><span class=\"hl\">a\n"
            "<lineno n=\"2\"/>b\n</span></code></pre>");

    REQUIRE(env._collaborators._highlighted.size() == 1);

    const prepress::code_options& options = env._collaborators._highlighted[0];
    REQUIRE(prepress::find_code_option(options, "lang") == "cpp");
    REQUIRE(prepress::find_code_option(options, "linenos") == "");
    REQUIRE(!prepress::find_code_option(options, "other").has_value());
}

TEST_CASE("code blocks #2")
{
    // Line numbers without highlighting, across several text nodes.
    REQUIRE(run_pass(&prepress::format_code_blocks,
                "<pre>:linenos:\n\nx\n<b>y\nz</b></pre>") ==
            "<pre><code><lineno n=\"1\"/>x\n<lineno n=\"2\"/>"
            "<b>y\n<lineno n=\"3\"/>z</b></code></pre>");
}

TEST_CASE("code blocks #3")
{
    test_env env;
    env._cfg.skip_code_highlighting = true;

    REQUIRE(env.run(&prepress::format_code_blocks, "<pre>:lang: cpp\n\nx\n</pre>") ==
            "<pre><code>x\n</code></pre>");

    REQUIRE(env._collaborators._highlighted.empty());
}

TEST_CASE("code blocks #4")
{
    test_env env;
    env._collaborators._highlight_fails = true;

    REQUIRE(env.run(&prepress::format_code_blocks, "<pre>:lang: cpp\n\nx</pre>") ==
            "<pre><code>x</code></pre>");

    REQUIRE(env._err.str() ==
            "((HIGHLIGHT ERROR))(42): Could not highlight code block 'x' "
            "(unknown language)\n\n");
}

TEST_CASE("code blocks #5")
{
    test_env env;
    env._collaborators._highlight_changes_text = true;

    REQUIRE(env.run(&prepress::format_code_blocks, "<pre>:lang: cpp\n\nx</pre>") ==
            "<pre><code>x</code></pre>");

    REQUIRE(!env._err.str().empty());
}

TEST_CASE("code blocks #6")
{
    // Not an options block: no blank line after it.
    REQUIRE(run_pass(&prepress::format_code_blocks, "<pre>:a: b\ncode</pre>") ==
            "<pre><code>:a: b\ncode</code></pre>");
}

TEST_CASE("line breaks #0")
{
    REQUIRE(run_pass(&prepress::replace_newlines, "a\nb\n\nc") ==
            "a" LSEP "b\n\nc");

    REQUIRE(run_pass(&prepress::replace_newlines, "\nx") == LSEP "x");

    REQUIRE(run_pass(&prepress::replace_newlines, "<pre>a\nb</pre>") ==
            "<pre>a\nb</pre>");
}

TEST_CASE("line breaks #1")
{
    // Single newlines between blocks stay paragraph breaks.
    REQUIRE(run_pass(&prepress::replace_newlines, "<p>x</p>\ntext\nmore\n<p>y</p>") ==
            "<p>x</p>\ntext" LSEP "more\n<p>y</p>");

    REQUIRE(run_pass(&prepress::replace_newlines, "<p>x</p>\n<p>y</p>") ==
            "<p>x</p>\n<p>y</p>");
}

TEST_CASE("ellipses")
{
    REQUIRE(run_pass(&prepress::replace_ellipses, "Wait... what....") ==
            "Wait" ELLIPSIS " what" ELLIPSIS ".");

    REQUIRE(run_pass(&prepress::replace_ellipses, "<code>...</code>") ==
            "<code>...</code>");

    REQUIRE(run_pass(&prepress::replace_ellipses, R"(<link href="a...b">a...b</link>)") ==
            R"(<link href="a...b">a...b</link>)");
}

TEST_CASE("links")
{
    REQUIRE(run_pass(&prepress::replace_links, "Visit example.com/path. Then stop.") ==
            R"(Visit <link href="example.com/path">example.com/path</link>. Then stop.)");

    REQUIRE(run_pass(&prepress::replace_links, "a.org b.gov c.ca") ==
            R"(<link href="a.org">a.org</link> <link href="b.gov">b.gov</link> )"
            R"(<link href="c.ca">c.ca</link>)");

    REQUIRE(run_pass(&prepress::replace_links, R"(<link href="x">site.com</link>)") ==
            R"(<link href="x">site.com</link>)");

    REQUIRE(run_pass(&prepress::replace_links, "no links here.") == "no links here.");
}

TEST_CASE("normalize_dashes")
{
    using prepress::normalize_dashes;

    REQUIRE(normalize_dashes("5 - 10") == "5" EN_DASH "10");
    REQUIRE(normalize_dashes("1--2") == "1" EN_DASH "2");
    REQUIRE(normalize_dashes("pages 10 -- 20") == "pages 10" EN_DASH "20");
    REQUIRE(normalize_dashes("a - b") == "a " EM_DASH " b");
    REQUIRE(normalize_dashes("a--b") == "a " EM_DASH " b");
    REQUIRE(normalize_dashes("a --- b") == "a " EM_DASH " b");
    REQUIRE(normalize_dashes("a" EM_DASH "b") == "a " EM_DASH " b");
    REQUIRE(normalize_dashes("1---2") == "1 " EM_DASH " 2");
    REQUIRE(normalize_dashes("well-known") == "well-known");
}

TEST_CASE("normalize_dashes is idempotent")
{
    using prepress::normalize_dashes;

    for (const std::string_view input :
        {"a - b"sv, "5 - 10"sv, "x -- y"sv, "a" EM_DASH "b"sv})
    {
        const std::string once = normalize_dashes(input);
        REQUIRE(normalize_dashes(once) == once);
    }
}

TEST_CASE("dashes")
{
    REQUIRE(run_pass(&prepress::replace_dashes,
                R"(a - b <code>c - d</code> <link href="e">f--g</link>)") ==
            R"(a )" EM_DASH R"( b <code>c - d</code> <link href="e">f--g</link>)");
}

TEST_CASE("smart quotes")
{
    REQUIRE(run_pass(&prepress::add_smart_quotes, R"("a" <code>"b"</code>)") ==
            LDQ "a" RDQ R"( <code>"b"</code>)");

    REQUIRE(run_pass(&prepress::add_smart_quotes, R"(<link href="x">it's "here"</link>)") ==
            R"(<link href="x">it's "here"</link>)");

    // Link text is not rewritten but still decides the quote that follows it.
    REQUIRE(run_pass(&prepress::add_smart_quotes, R"("<link href="x">a</link>")") ==
            LDQ R"(<link href="x">a</link>)" RDQ);
}

TEST_CASE("punctuation in quotes")
{
    REQUIRE(run_pass(&prepress::punctuation_in_quotes,
                LDQ "word" RDQ ". it" RSQ ", ok") ==
            LDQ "word." RDQ " it," RSQ " ok");

    REQUIRE(run_pass(&prepress::punctuation_in_quotes,
                R"(<link href="x">)" RDQ ". x</link>") ==
            R"(<link href="x">)" RDQ ". x</link>");
}

TEST_CASE("extraneous spaces #0")
{
    test_env env;

    REQUIRE(env.run(&prepress::remove_extraneous_spaces, "a  b.   c  <pre>x  y</pre>") ==
            "a b. c <pre>x  y</pre>");

    REQUIRE(env._err.str() ==
            "((PREPRESS NOTE))(42): Removed extraneous spaces in article "
            "\"Hello World, again\"\n\n");
}

TEST_CASE("extraneous spaces #1")
{
    test_env env;

    REQUIRE(env.run(&prepress::remove_extraneous_spaces, "a." NBSP " b. c") ==
            "a. b. c");

    REQUIRE(env._err.str() ==
            "((PREPRESS NOTE))(42): Removed extraneous spaces in article "
            "\"Hello World, again\". Some were nbsp-sp pairs.\n\n");
}

TEST_CASE("extraneous spaces #2")
{
    test_env env;

    REQUIRE(env.run(&prepress::remove_extraneous_spaces, "  lead a b") ==
            "  lead a b");

    REQUIRE(env._err.str().empty());
}

TEST_CASE("footnote after punctuation")
{
    REQUIRE(run_pass(&prepress::footnote_after_punctuation, "word[1]. next[], x[2]") ==
            "word.[1] next,[] x[2]");
}

TEST_CASE("footnotes")
{
    REQUIRE(run_pass(&prepress::add_footnotes, "a.[1] b.[] c[5] d[]") ==
            "a.<sup>1</sup> b.<sup>2</sup> c<sup>5</sup> d<sup>6</sup>");
}

TEST_CASE("emphasis collapse")
{
    REQUIRE(run_pass(&prepress::collapse_nested_emphasis,
                "<b>x<i>y</i></b><em>z<strong>w</strong></em><i>only</i>") ==
            "<b>x<em2>y</em2></b><em>z<em2>w</em2></em><i>only</i>");
}

TEST_CASE("profquotes")
{
    test_env env;
    env._article._title = "profQUOTES";

    REQUIRE(env.run(&prepress::convert_profquotes, "<ul><li>a</li></ul><ol></ol>") ==
            "<profquotes><li>a</li></profquotes><ol/>");

    REQUIRE(run_pass(&prepress::convert_profquotes, "<ul><li>a</li></ul>") ==
            "<ul><li>a</li></ul>");
}

TEST_CASE("rating fractions")
{
    REQUIRE(run_pass(&prepress::hairspace_rating_fractions,
                "rated 7/10, not 7/100; 10/10") ==
            "rated 7" HAIR "/" HAIR "10, not 7/100; 10" HAIR "/" HAIR "10");
}

TEST_CASE("lists")
{
    REQUIRE(run_pass(&prepress::fix_lists, "<ul><li>A<ul><li>B</li></ul></li></ul>") ==
            "<ul><ul_first>A</ul_first><ul2>B</ul2></ul>");
}
