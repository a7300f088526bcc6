#include "passes.hpp"

#include "article.hpp"
#include "footnote_numberer.hpp"
#include "node_tree.hpp"
#include "protected_region.hpp"
#include "quote_resolver.hpp"
#include "text_scan.hpp"

#include <re2/re2.h>

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace prepress {

namespace {

// UTF-8 encodings of the characters the text passes produce.
constexpr std::string_view line_separator{"\xE2\x80\xA8"}; // U+2028
constexpr std::string_view ellipsis{"\xE2\x80\xA6"};       // U+2026
constexpr std::string_view en_dash{"\xE2\x80\x93"};        // U+2013
constexpr std::string_view em_dash{"\xE2\x80\x94"};        // U+2014
constexpr std::string_view hair_space{"\xE2\x80\x8A"};     // U+200A

// Rewrites the content of every text node outside verbatim regions with `f`,
// which edits a copy of the content in place.
template <typename F>
void rewrite_text_nodes(node_tree& tree, F&& f)
{
    for (const node_id id :
        unprotected_text_nodes(tree, tree.root(), region::verbatim))
    {
        std::string content = tree.text(id);
        f(id, content);
        tree.set_text(id, content);
    }
}

// As `rewrite_text_nodes`, also leaving link text alone so that it keeps
// matching its `href`.
template <typename F>
void rewrite_unlinked_text_nodes(node_tree& tree, F&& f)
{
    rewrite_text_nodes(tree,
        [&](const node_id id, std::string& content)
        {
            if (!is_protected(tree, id, region::link))
            {
                f(id, content);
            }
        });
}

[[nodiscard]] bool is_digit(const char c) noexcept
{
    return c >= '0' && c <= '9';
}

// Length of a ` ?--? ?` run starting at `i` that is followed by a digit, or
// zero. Longer runs are preferred.
[[nodiscard]] std::size_t numeric_range_length(
    const std::string_view text, const std::size_t i) noexcept
{
    for (const std::size_t lead : {1u, 0u})
    {
        for (const std::size_t hyphens : {2u, 1u})
        {
            for (const std::size_t trail : {1u, 0u})
            {
                const std::size_t len = lead + hyphens + trail;
                if (i + len >= text.size())
                {
                    continue;
                }

                const std::string_view run = text.substr(i, len);
                const bool shape_ok =
                    (lead == 0 || run.front() == ' ') &&
                    (trail == 0 || run.back() == ' ') &&
                    run.substr(lead, hyphens).find_first_not_of('-') ==
                        std::string_view::npos;

                if (shape_ok && is_digit(text[i + len]))
                {
                    return len;
                }
            }
        }
    }

    return 0;
}

[[nodiscard]] bool has_element_sibling(const node_tree& tree, const node_id id,
    const bool before) noexcept
{
    const node_id parent = tree.parent(id);
    if (parent == null_node)
    {
        return false;
    }

    const std::optional<std::size_t> idx = tree.index_in_parent(id);
    if (!idx.has_value())
    {
        return false;
    }

    const std::vector<node_id>& siblings = tree.children(parent);
    const std::size_t first = before ? 0 : *idx + 1;
    const std::size_t last = before ? *idx : siblings.size();

    for (std::size_t i = first; i < last; ++i)
    {
        if (tree.is_element(siblings[i]))
        {
            return true;
        }
    }

    return false;
}

// Splits `text` on newlines that are not part of a run of newlines.
[[nodiscard]] std::vector<std::string_view> split_single_newlines(
    const std::string_view text)
{
    std::vector<std::string_view> pieces;
    std::size_t piece_begin = 0;

    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const bool single = text[i] == '\n' &&
                            (i == 0 || text[i - 1] != '\n') &&
                            (i + 1 == text.size() || text[i + 1] != '\n');

        if (single)
        {
            pieces.push_back(text.substr(piece_begin, i - piece_begin));
            piece_begin = i + 1;
        }
    }

    pieces.push_back(text.substr(piece_begin));
    return pieces;
}

} // namespace

std::string normalize_dashes(const std::string_view text)
{
    std::string result;
    result.reserve(text.size());

    for (std::size_t i = 0; i < text.size();)
    {
        if (i > 0 && is_digit(text[i - 1]))
        {
            if (const std::size_t len = numeric_range_length(text, i); len > 0)
            {
                result.append(en_dash);
                i += len;
                continue;
            }
        }

        result.push_back(text[i]);
        ++i;
    }

    replace_all(result, " - ", em_dash);
    replace_all(result, " --- ", em_dash);
    replace_all(result, "---", em_dash);
    replace_all(result, " -- ", em_dash);
    replace_all(result, "--", em_dash);

    const std::string spaced_em_dash =
        std::string{" "} + std::string{em_dash} + std::string{" "};

    replace_all(result, spaced_em_dash, em_dash);
    replace_all(result, em_dash, spaced_em_dash);

    return result;
}

bool normalize_newlines(article& a, pass_context& ctx)
{
    (void)ctx;
    node_tree& tree = a._content;

    for (const node_id id : tree.text_nodes(tree.root()))
    {
        std::string content = tree.text(id);
        replace_all(content, "\r\n", "\n");
        tree.set_text(id, content);
    }

    return true;
}

bool replace_inline_code(article& a, pass_context& ctx)
{
    (void)ctx;
    static const RE2 inline_code{R"(`([\s\S]+?)`)"};

    node_tree& tree = a._content;

    for (const node_id text_id :
        unprotected_text_nodes(tree, tree.root(), region::verbatim))
    {
        const bool ok = splice_matches(tree, text_id, inline_code,
            [&](const text_match& match) -> std::optional<node_id>
            {
                const node_id code = tree.create_element("code");
                const node_id text = tree.create_text(match.group(1));

                if (!tree.append_child(code, text))
                {
                    return std::nullopt;
                }

                return {code};
            });

        if (!ok)
        {
            return false;
        }
    }

    return true;
}

bool replace_newlines(article& a, pass_context& ctx)
{
    (void)ctx;
    node_tree& tree = a._content;

    rewrite_text_nodes(tree,
        [&](const node_id id, std::string& content)
        {
            std::vector<std::string_view> pieces = split_single_newlines(content);

            // A single newline against an element is a paragraph break
            // between blocks, not a line break inside one.
            std::string_view prefix;
            std::string_view suffix;

            if (pieces.size() > 1 && pieces.front().empty() &&
                has_element_sibling(tree, id, true))
            {
                pieces.erase(pieces.begin());
                prefix = "\n";
            }

            if (pieces.size() > 1 && pieces.back().empty() &&
                has_element_sibling(tree, id, false))
            {
                pieces.pop_back();
                suffix = "\n";
            }

            std::string result{prefix};
            for (std::size_t i = 0; i < pieces.size(); ++i)
            {
                if (i > 0)
                {
                    result.append(line_separator);
                }

                result.append(pieces[i]);
            }

            result.append(suffix);
            content = std::move(result);
        });

    return true;
}

bool replace_ellipses(article& a, pass_context& ctx)
{
    (void)ctx;

    rewrite_unlinked_text_nodes(a._content,
        [](node_id, std::string& content) { replace_all(content, "...", ellipsis); });

    return true;
}

bool replace_links(article& a, pass_context& ctx)
{
    (void)ctx;

    // URL characters, then the same without trailing sentence punctuation.
    static const std::string url_char{R"([A-Za-z0-9\-._~:/?#\[\]@!$&'()*+,;%=])"};
    static const std::string url_end_char{R"([A-Za-z0-9\-_~/#\[\]@$&'()*+%=])"};

    static const RE2 link{url_char + R"(+(?:\.com|\.ca|\.org|\.gov)(?:)" +
                          url_char + "*" + url_end_char + "+)?"};

    node_tree& tree = a._content;

    for (const node_id text_id :
        unprotected_text_nodes(tree, tree.root(), region::verbatim))
    {
        if (is_protected(tree, text_id, region::link))
        {
            continue;
        }

        const bool ok = splice_matches(tree, text_id, link,
            [&](const text_match& match) -> std::optional<node_id>
            {
                const node_id element = tree.create_element("link");
                tree.set_attribute(element, "href", match.literal());

                const node_id text = tree.create_text(match.literal());
                if (!tree.append_child(element, text))
                {
                    return std::nullopt;
                }

                return {element};
            });

        if (!ok)
        {
            return false;
        }
    }

    return true;
}

bool replace_dashes(article& a, pass_context& ctx)
{
    (void)ctx;

    rewrite_unlinked_text_nodes(a._content,
        [](node_id, std::string& content) { content = normalize_dashes(content); });

    return true;
}

bool add_smart_quotes(article& a, pass_context& ctx)
{
    (void)ctx;
    node_tree& tree = a._content;

    const quote_resolver resolver{tree, tree.root()};
    resolver.apply(tree);

    return true;
}

bool punctuation_in_quotes(article& a, pass_context& ctx)
{
    (void)ctx;
    static const RE2 outside{R"(([\x{2019}\x{201D}])([.!?;:,]))"};

    rewrite_unlinked_text_nodes(a._content,
        [](node_id, std::string& content)
        { RE2::GlobalReplace(&content, outside, R"(\2\1)"); });

    return true;
}

bool remove_extraneous_spaces(article& a, pass_context& ctx)
{
    static const std::string single_spaced{
        R"(([A-Za-z0-9\x{C0}-\x{D6}\x{D8}-\x{F6}\x{F8}-\x{FF}[:punct:]\x{203D}]))"};

    // Some editors put an NBSP in front of the space after a sentence; those
    // pairs go first so that no NBSP is left to break the space collapsing.
    static const RE2 nbsp_space_pairs{single_spaced + R"((?:\x{A0} )+)"};
    static const RE2 space_runs{single_spaced + "  +"};

    bool nbsp_found = false;
    bool changed = false;

    rewrite_text_nodes(a._content,
        [&](node_id, std::string& content)
        {
            if (RE2::GlobalReplace(&content, nbsp_space_pairs, R"(\1 )") > 0)
            {
                nbsp_found = true;
                changed = true;
            }

            if (RE2::GlobalReplace(&content, space_runs, R"(\1 )") > 0)
            {
                changed = true;
            }
        });

    if (changed)
    {
        ctx._diagnostics.note_stream()
            << "Removed extraneous spaces in article \"" << a._title << '"'
            << (nbsp_found ? ". Some were nbsp-sp pairs." : "") << "\n\n";
    }

    return true;
}

bool footnote_after_punctuation(article& a, pass_context& ctx)
{
    (void)ctx;
    static const RE2 marker_first{R"((\[\d*\])([.,!?;:]))"};

    rewrite_text_nodes(a._content,
        [](node_id, std::string& content)
        { RE2::GlobalReplace(&content, marker_first, R"(\2\1)"); });

    return true;
}

bool add_footnotes(article& a, pass_context& ctx)
{
    (void)ctx;
    return number_footnotes(a._content, a._content.root());
}

bool hairspace_rating_fractions(article& a, pass_context& ctx)
{
    (void)ctx;
    static const RE2 out_of_ten{R"(\b([0-9]+)/10\b)"};

    const std::string rewrite = std::string{R"(\1)"} + std::string{hair_space} +
                                "/" + std::string{hair_space} + "10";

    rewrite_text_nodes(a._content,
        [&](node_id, std::string& content)
        { RE2::GlobalReplace(&content, out_of_ten, rewrite); });

    return true;
}

} // namespace prepress
