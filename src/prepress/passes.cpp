#include "passes.hpp"

#include <array>
#include <span>

namespace prepress {

namespace {

constexpr std::array catalog{
    pass{"captions", &process_captions},
    pass{"normalize newlines", &normalize_newlines},
    pass{"embeds", &convert_imgur_embeds},
    pass{"media", &download_images},
    pass{"math", &compile_latex},
    pass{"inline code", &replace_inline_code},
    pass{"manual highlight", &convert_manual_highlighting},
    pass{"code blocks", &format_code_blocks},
    pass{"line breaks", &replace_newlines},
    pass{"ellipses", &replace_ellipses},
    pass{"links", &replace_links},
    pass{"dashes", &replace_dashes},
    pass{"quotes", &add_smart_quotes},
    pass{"punctuation in quotes", &punctuation_in_quotes},
    pass{"extraneous spaces", &remove_extraneous_spaces},
    pass{"footnote after punctuation", &footnote_after_punctuation},
    pass{"footnotes", &add_footnotes},
    pass{"emphasis collapse", &collapse_nested_emphasis},
    pass{"profquotes", &convert_profquotes},
    pass{"rating fractions", &hairspace_rating_fractions},
    pass{"lists", &fix_lists},
};

} // namespace

std::span<const pass> pass_catalog() noexcept
{
    return catalog;
}

} // namespace prepress
