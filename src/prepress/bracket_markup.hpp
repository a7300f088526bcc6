#pragma once

#include <string>
#include <string_view>

namespace prepress {

// Rewrites the editor's bracket shortcodes into element tags, before the
// source is read into a tree:
//
//     [caption id="x"] ... [/caption]   ->  <caption id="x"> ... </caption>
//     [em1] [emphasis 1] .. [em4]       ->  <em> .. <em4>
//     [str1] [stress 1], [str2] ...     ->  <strong>, <strong2>
//     [article] [aref]                  ->  <aref>
//     [math]                            ->  <imath>
//
// Closing forms (`[/em1]`, ...) map to the matching closing tags. Anything
// else in square brackets is left alone.
[[nodiscard]] std::string expand_bracket_markup(const std::string_view source);

} // namespace prepress
