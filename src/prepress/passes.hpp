#pragma once

#include "article.hpp"
#include "collaborators.hpp"
#include "diagnostics.hpp"
#include "pipeline.hpp"

#include <span>
#include <string>
#include <string_view>

namespace prepress {

// Everything a pass may use besides the article itself. Built once per
// article; passes keep any further state in locals.
struct pass_context
{
    const pipeline::config& _config;
    collaborators& _collaborators;
    diagnostics& _diagnostics;
};

// Returns `false` only if a tree invariant was violated.
using pass_fn = bool (*)(article&, pass_context&);

struct pass
{
    std::string_view _name;
    pass_fn _fn;
};

// The passes, in the order they must run.
[[nodiscard]] std::span<const pass> pass_catalog() noexcept;

//
// Structure
// ----------------------------------------------------------------------------
[[nodiscard]] bool process_captions(article& a, pass_context& ctx);
[[nodiscard]] bool convert_manual_highlighting(article& a, pass_context& ctx);
[[nodiscard]] bool format_code_blocks(article& a, pass_context& ctx);
[[nodiscard]] bool collapse_nested_emphasis(article& a, pass_context& ctx);
[[nodiscard]] bool convert_profquotes(article& a, pass_context& ctx);
[[nodiscard]] bool fix_lists(article& a, pass_context& ctx);

//
// Assets (talk to collaborators)
// ----------------------------------------------------------------------------
[[nodiscard]] bool convert_imgur_embeds(article& a, pass_context& ctx);
[[nodiscard]] bool download_images(article& a, pass_context& ctx);
[[nodiscard]] bool compile_latex(article& a, pass_context& ctx);

//
// Text
// ----------------------------------------------------------------------------
[[nodiscard]] bool normalize_newlines(article& a, pass_context& ctx);
[[nodiscard]] bool replace_inline_code(article& a, pass_context& ctx);
[[nodiscard]] bool replace_newlines(article& a, pass_context& ctx);
[[nodiscard]] bool replace_ellipses(article& a, pass_context& ctx);
[[nodiscard]] bool replace_links(article& a, pass_context& ctx);
[[nodiscard]] bool replace_dashes(article& a, pass_context& ctx);
[[nodiscard]] bool add_smart_quotes(article& a, pass_context& ctx);
[[nodiscard]] bool punctuation_in_quotes(article& a, pass_context& ctx);
[[nodiscard]] bool remove_extraneous_spaces(article& a, pass_context& ctx);
[[nodiscard]] bool footnote_after_punctuation(article& a, pass_context& ctx);
[[nodiscard]] bool add_footnotes(article& a, pass_context& ctx);
[[nodiscard]] bool hairspace_rating_fractions(article& a, pass_context& ctx);

// Dash rules on a plain string, in the order `replace_dashes` applies them.
[[nodiscard]] std::string normalize_dashes(const std::string_view text);

} // namespace prepress
