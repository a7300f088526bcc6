#include "tag.hpp"

#include <array>
#include <string_view>
#include <utility>

namespace prepress {

namespace {

using namespace std::string_view_literals;

constexpr std::array tag_names{
    std::pair{tag::pre, "pre"sv},
    std::pair{tag::code, "code"sv},
    std::pair{tag::link, "link"sv},
    std::pair{tag::a, "a"sv},
    std::pair{tag::img, "img"sv},
    std::pair{tag::caption, "caption"sv},
    std::pair{tag::figcaption, "figcaption"sv},
    std::pair{tag::b, "b"sv},
    std::pair{tag::strong, "strong"sv},
    std::pair{tag::i, "i"sv},
    std::pair{tag::em, "em"sv},
    std::pair{tag::em2, "em2"sv},
    std::pair{tag::u, "u"sv},
    std::pair{tag::hl_bold, "hl_bold"sv},
    std::pair{tag::hl_italic, "hl_italic"sv},
    std::pair{tag::hl_underline, "hl_underline"sv},
    std::pair{tag::li, "li"sv},
    std::pair{tag::ul, "ul"sv},
    std::pair{tag::ul2, "ul2"sv},
    std::pair{tag::ul3, "ul3"sv},
    std::pair{tag::ul4, "ul4"sv},
    std::pair{tag::ul5, "ul5"sv},
    std::pair{tag::ol, "ol"sv},
    std::pair{tag::ol2, "ol2"sv},
    std::pair{tag::ol3, "ol3"sv},
    std::pair{tag::profquotes, "profquotes"sv},
    std::pair{tag::ul_first, "ul_first"sv},
    std::pair{tag::ol_first, "ol_first"sv},
    std::pair{tag::sup, "sup"sv},
    std::pair{tag::lineno, "lineno"sv},
    std::pair{tag::footer, "footer"sv},
    std::pair{tag::address, "address"sv},
};

} // namespace

tag classify_tag(const std::string_view name) noexcept
{
    for (const auto& [t, n] : tag_names)
    {
        if (n == name)
        {
            return t;
        }
    }

    return tag::other;
}

std::string_view tag_name(const tag t) noexcept
{
    for (const auto& [candidate, n] : tag_names)
    {
        if (candidate == t)
        {
            return n;
        }
    }

    return {};
}

bool is_bold_tag(const tag t) noexcept
{
    return t == tag::b || t == tag::strong;
}

bool is_italic_tag(const tag t) noexcept
{
    return t == tag::i || t == tag::em;
}

bool is_unordered_list_tag(const tag t) noexcept
{
    switch (t)
    {
        case tag::ul:
        case tag::ul2:
        case tag::ul3:
        case tag::ul4:
        case tag::ul5: return true;
        default: return false;
    }
}

bool is_ordered_list_tag(const tag t) noexcept
{
    switch (t)
    {
        case tag::ol:
        case tag::ol2:
        case tag::ol3: return true;
        default: return false;
    }
}

} // namespace prepress
