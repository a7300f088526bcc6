#pragma once

#include <cstdint>
#include <string_view>

namespace prepress {

// Tag names the passes dispatch on. Anything else is `other` and is carried
// through untouched.
enum class tag : std::uint8_t
{
    other,

    // Verbatim containers
    pre,
    code,

    // Links and media
    link,
    a,
    img,
    caption,
    figcaption,

    // Inline emphasis
    b,
    strong,
    i,
    em,
    em2,
    u,

    // Manual code highlighting
    hl_bold,
    hl_italic,
    hl_underline,

    // Lists
    li,
    ul,
    ul2,
    ul3,
    ul4,
    ul5,
    ol,
    ol2,
    ol3,
    profquotes,
    ul_first,
    ol_first,

    // Footnotes, line numbers, article furniture
    sup,
    lineno,
    footer,
    address
};

[[nodiscard]] tag classify_tag(const std::string_view name) noexcept;

[[nodiscard]] std::string_view tag_name(const tag t) noexcept;

[[nodiscard]] bool is_bold_tag(const tag t) noexcept;
[[nodiscard]] bool is_italic_tag(const tag t) noexcept;

// `ul` .. `ul5`
[[nodiscard]] bool is_unordered_list_tag(const tag t) noexcept;

// `ol` .. `ol3`
[[nodiscard]] bool is_ordered_list_tag(const tag t) noexcept;

} // namespace prepress
