#include "quote_resolver.hpp"

#include "node_tree.hpp"
#include "protected_region.hpp"
#include "utf8.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prepress {

namespace {

[[nodiscard]] bool is_whitespace(const char32_t c) noexcept
{
    switch (c)
    {
        case U' ':
        case U'\t':
        case U'\n':
        case U'\r':
        case U'\f':
        case U'\v':
        case 0x00A0: // no-break space
        case 0x2009: // thin space
        case 0x200A: // hair space
        case 0x2028: // line separator
        case 0x2029: // paragraph separator
        case 0x3000: return true;
        default: return false;
    }
}

[[nodiscard]] bool is_opening_punctuation(const char32_t c) noexcept
{
    switch (c)
    {
        case U'(':
        case U'[':
        case U'{':
        case U'<':
        case 0x201C: // left double quote
        case 0x2018: // left single quote
        case 0x2014: // em dash
        case 0x2013: return true; // en dash
        default: return false;
    }
}

} // namespace

quote_direction get_quote_direction(const std::optional<char32_t> before) noexcept
{
    if (!before.has_value() || is_whitespace(*before) ||
        is_opening_punctuation(*before))
    {
        return quote_direction::opening;
    }

    return quote_direction::closing;
}

std::u32string resolve_quotes(
    const std::u32string_view text, const std::optional<char32_t> before)
{
    std::u32string result{text};

    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char32_t c = text[i];
        if (c != U'"' && c != U'\'')
        {
            continue;
        }

        const std::optional<char32_t> prev =
            i == 0 ? before : std::optional<char32_t>{text[i - 1]};

        const bool opening = get_quote_direction(prev) == quote_direction::opening;

        if (c == U'"')
        {
            result[i] = opening ? 0x201C : 0x201D;
        }
        else
        {
            result[i] = opening ? 0x2018 : 0x2019;
        }
    }

    return result;
}

quote_resolver::quote_resolver(const node_tree& tree, const node_id root)
    : _nodes{tree.text_nodes(root)}
{
    _original.reserve(_nodes.size());
    _skipped.reserve(_nodes.size());

    for (const node_id id : _nodes)
    {
        _original.push_back(decode_utf8(tree.text(id)));
        _skipped.push_back(is_protected(tree, id, region::verbatim) ||
                           is_protected(tree, id, region::link));
    }
}

std::optional<char32_t> quote_resolver::borrow_before(
    const std::size_t index) const noexcept
{
    for (std::size_t i = index; i-- > 0;)
    {
        if (!_original[i].empty())
        {
            return {_original[i].back()};
        }
    }

    return std::nullopt;
}

void quote_resolver::apply(node_tree& tree) const
{
    for (std::size_t i = 0; i < _nodes.size(); ++i)
    {
        if (_skipped[i])
        {
            continue;
        }

        const std::u32string resolved =
            resolve_quotes(_original[i], borrow_before(i));

        if (resolved != _original[i])
        {
            tree.set_text(_nodes[i], encode_utf8(resolved));
        }
    }
}

} // namespace prepress
