#include "bracket_markup.hpp"

#include "text_scan.hpp"

#include <re2/re2.h>

#include <array>
#include <string>
#include <string_view>
#include <utility>

namespace prepress {

namespace {

using namespace std::string_view_literals;

// Shortcode spelling -> tag name.
constexpr std::array shortcodes{
    std::pair{"emphasis 1"sv, "em"sv},
    std::pair{"emphasis 2"sv, "em2"sv},
    std::pair{"emphasis 3"sv, "em3"sv},
    std::pair{"emphasis 4"sv, "em4"sv},
    std::pair{"em1"sv, "em"sv},
    std::pair{"em2"sv, "em2"sv},
    std::pair{"em3"sv, "em3"sv},
    std::pair{"em4"sv, "em4"sv},
    std::pair{"stress 1"sv, "strong"sv},
    std::pair{"stress 2"sv, "strong2"sv},
    std::pair{"str1"sv, "strong"sv},
    std::pair{"str2"sv, "strong2"sv},
    std::pair{"article"sv, "aref"sv},
    std::pair{"aref"sv, "aref"sv},
    std::pair{"math"sv, "imath"sv},
};

} // namespace

std::string expand_bracket_markup(const std::string_view source)
{
    static const RE2 caption_open{R"(\[caption([^\]]*)\])"};

    std::string result{source};

    RE2::GlobalReplace(&result, caption_open, R"(<caption\1>)");
    replace_all(result, "[/caption]", "</caption>");

    std::string needle;
    std::string replacement;

    for (const auto& [code, element] : shortcodes)
    {
        for (const bool closing : {false, true})
        {
            needle.clear();
            needle.append(closing ? "[/" : "[");
            needle.append(code);
            needle.append("]");

            replacement.clear();
            replacement.append(closing ? "</" : "<");
            replacement.append(element);
            replacement.append(">");

            replace_all(result, needle, replacement);
        }
    }

    return result;
}

} // namespace prepress
