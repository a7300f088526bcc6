#include "passes.hpp"

#include "article.hpp"
#include "collaborators.hpp"
#include "list_restructurer.hpp"
#include "markup.hpp"
#include "node_tree.hpp"
#include "protected_region.hpp"
#include "span_splicer.hpp"
#include "tag.hpp"

#include <re2/re2.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prepress {

namespace {

using namespace std::string_view_literals;

[[nodiscard]] std::vector<node_id> elements_with_tag(
    const node_tree& tree, const node_id root, const tag t)
{
    std::vector<node_id> result;

    for (const node_id id : tree.descendants(root))
    {
        if (tag_of(tree, id) == t)
        {
            result.push_back(id);
        }
    }

    return result;
}

// Parses a leading block of `:name: value` lines terminated by a blank line.
// Returns the number of bytes the block spans, or zero if `text` does not
// start with one.
[[nodiscard]] std::size_t parse_code_options(
    const std::string_view text, code_options& options)
{
    static const RE2 option_line{R"(\s*:(\S+?):[ \t]*([^\n]*)\n)"};
    static const RE2 block_end{R"([ \t]*\n+)"};

    re2::StringPiece input{text.data(), text.size()};
    std::string name;
    std::string value;

    code_options parsed;
    while (RE2::Consume(&input, option_line, &name, &value))
    {
        parsed.push_back(code_option{._name = name, ._value = value});
    }

    if (parsed.empty() || !RE2::Consume(&input, block_end))
    {
        return 0;
    }

    options = std::move(parsed);
    return text.size() - input.size();
}

// Strips a leading options block off the first text child of `pre_id`.
[[nodiscard]] bool take_code_options(
    node_tree& tree, const node_id pre_id, code_options& options)
{
    if (tree.children(pre_id).empty())
    {
        return true;
    }

    const node_id first = tree.children(pre_id).front();
    if (!tree.is_text(first))
    {
        return true;
    }

    const std::string content = tree.text(first);
    const std::size_t consumed = parse_code_options(content, options);

    if (consumed == 0)
    {
        return true;
    }

    if (consumed == content.size())
    {
        return tree.detach(first);
    }

    tree.set_text(first, std::string_view{content}.substr(consumed));
    return true;
}

// Moves the current children of `pre_id` into a `code` element, reusing an
// existing lone `code` child.
[[nodiscard]] std::optional<node_id> take_code_element(
    node_tree& tree, const node_id pre_id)
{
    const std::vector<node_id> kids = tree.children(pre_id);

    if (kids.size() == 1 && tag_of(tree, kids.front()) == tag::code)
    {
        if (!tree.detach(kids.front()))
        {
            return std::nullopt;
        }

        return {kids.front()};
    }

    if (!tree.clear_children(pre_id))
    {
        return std::nullopt;
    }

    const node_id code = tree.create_element("code");
    for (const node_id child : kids)
    {
        if (!tree.append_child(code, child))
        {
            return std::nullopt;
        }
    }

    return {code};
}

// Highlights the text of `pre_id` through the collaborator. Returns the new
// `code` element, or `null_node` if highlighting failed and the block should
// be kept as is.
[[nodiscard]] std::optional<node_id> highlight_code_block(node_tree& tree,
    const node_id pre_id, const code_options& options, pass_context& ctx)
{
    const std::string source = tree.text_content(pre_id);

    std::string markup;
    if (const auto err =
            ctx._collaborators.highlight_code(markup, source, options);
        err.has_value())
    {
        ctx._diagnostics.collaborator_failure(
            "HIGHLIGHT", "Could not highlight code block", source, err->_reason);

        return {null_node};
    }

    const node_id code = tree.create_element("code");
    if (!read_markup(tree, code, markup))
    {
        return std::nullopt;
    }

    if (tree.text_content(code) != source)
    {
        ctx._diagnostics.collaborator_failure("HIGHLIGHT",
            "Highlighter changed the text of code block", source,
            "highlighted markup discarded");

        return {null_node};
    }

    return {code};
}

[[nodiscard]] node_id make_line_marker(node_tree& tree, const std::size_t line)
{
    const node_id marker = tree.create_element("lineno");
    tree.set_attribute(marker, "n", std::to_string(line));
    return marker;
}

// Puts an empty `lineno` marker at the start of every line of `code_id`. A
// trailing newline does not open a new line.
[[nodiscard]] bool add_line_numbers(node_tree& tree, const node_id code_id)
{
    const std::string full_text = tree.text_content(code_id);
    if (full_text.empty())
    {
        return true;
    }

    std::size_t line = 1;
    if (!tree.insert_child(code_id, 0, make_line_marker(tree, line)))
    {
        return false;
    }

    std::size_t consumed_before = 0;

    for (const node_id text_id : tree.text_nodes(code_id))
    {
        const std::string content = tree.text(text_id);

        node_id curr = text_id;
        std::size_t curr_offset = 0;

        for (std::size_t i = 0; i < content.size(); ++i)
        {
            if (content[i] != '\n' || consumed_before + i + 1 == full_text.size())
            {
                continue;
            }

            const std::optional<node_id> suffix =
                splice(tree, curr, i + 1 - curr_offset, i + 1 - curr_offset,
                    make_line_marker(tree, ++line));

            if (!suffix.has_value())
            {
                return false;
            }

            if (*suffix == null_node)
            {
                break;
            }

            curr = *suffix;
            curr_offset = i + 1;
        }

        consumed_before += content.size();
    }

    return true;
}

} // namespace

bool process_captions(article& a, pass_context& ctx)
{
    (void)ctx;
    node_tree& tree = a._content;

    for (const node_id caption : elements_with_tag(tree, tree.root(), tag::caption))
    {
        std::vector<node_id> images;
        std::vector<node_id> non_images;

        for (const node_id child : tree.children(caption))
        {
            const tag t = tag_of(tree, child);
            (t == tag::a || t == tag::img ? images : non_images).push_back(child);
        }

        if (!tree.clear_children(caption))
        {
            return false;
        }

        // The editor puts a space in front of every caption text.
        if (!non_images.empty() && tree.is_text(non_images.front()))
        {
            const std::string first = tree.text(non_images.front());

            if (first == " ")
            {
                non_images.erase(non_images.begin());
            }
            else if (!first.empty() && first.front() == ' ')
            {
                tree.set_text(non_images.front(), std::string_view{first}.substr(1));
            }
        }

        const node_id figcaption = tree.create_element("figcaption");
        for (const node_id child : non_images)
        {
            if (!tree.append_child(figcaption, child))
            {
                return false;
            }
        }

        images.push_back(figcaption);
        if (!tree.replace_with(caption, images))
        {
            return false;
        }
    }

    return true;
}

bool convert_manual_highlighting(article& a, pass_context& ctx)
{
    (void)ctx;
    node_tree& tree = a._content;

    for (const node_id id : tree.descendants(tree.root()))
    {
        if (!tree.is_element(id) || !is_protected(tree, id, region::verbatim))
        {
            continue;
        }

        switch (tag_of(tree, id))
        {
            case tag::b:
            case tag::strong: tree.rename(id, tag_name(tag::hl_bold)); break;

            case tag::i:
            case tag::em: tree.rename(id, tag_name(tag::hl_italic)); break;

            case tag::u: tree.rename(id, tag_name(tag::hl_underline)); break;

            default: break;
        }
    }

    return true;
}

bool format_code_blocks(article& a, pass_context& ctx)
{
    node_tree& tree = a._content;

    for (const node_id pre : elements_with_tag(tree, tree.root(), tag::pre))
    {
        code_options options;
        if (!take_code_options(tree, pre, options))
        {
            return false;
        }

        std::optional<node_id> code{null_node};

        if (find_code_option(options, "lang").has_value() &&
            !ctx._config.skip_code_highlighting)
        {
            code = highlight_code_block(tree, pre, options, ctx);
        }

        if (code.has_value() && *code != null_node)
        {
            code = tree.clear_children(pre) ? code : std::nullopt;
        }
        else if (code.has_value())
        {
            code = take_code_element(tree, pre);
        }

        if (!code.has_value())
        {
            return false;
        }

        if (find_code_option(options, "linenos").has_value() &&
            !add_line_numbers(tree, *code))
        {
            return false;
        }

        if (!tree.append_child(pre, *code))
        {
            return false;
        }
    }

    return true;
}

bool collapse_nested_emphasis(article& a, pass_context& ctx)
{
    (void)ctx;
    node_tree& tree = a._content;

    for (const node_id outer : tree.descendants(tree.root()))
    {
        if (!is_bold_tag(tag_of(tree, outer)))
        {
            continue;
        }

        for (const node_id inner : tree.descendants(outer))
        {
            if (is_italic_tag(tag_of(tree, inner)))
            {
                tree.rename(inner, tag_name(tag::em2));
            }
        }
    }

    for (const node_id outer : tree.descendants(tree.root()))
    {
        if (!is_italic_tag(tag_of(tree, outer)))
        {
            continue;
        }

        for (const node_id inner : tree.descendants(outer))
        {
            if (is_bold_tag(tag_of(tree, inner)))
            {
                tree.rename(inner, tag_name(tag::em2));
            }
        }
    }

    return true;
}

bool convert_profquotes(article& a, pass_context& ctx)
{
    (void)ctx;

    if (a._title != "profQUOTES"sv)
    {
        return true;
    }

    node_tree& tree = a._content;
    for (const node_id ul : elements_with_tag(tree, tree.root(), tag::ul))
    {
        tree.rename(ul, tag_name(tag::profquotes));
    }

    return true;
}

bool fix_lists(article& a, pass_context& ctx)
{
    (void)ctx;
    return restructure_lists(a._content, a._content.root());
}

} // namespace prepress
