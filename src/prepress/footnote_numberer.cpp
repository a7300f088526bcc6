#include "footnote_numberer.hpp"

#include "node_tree.hpp"
#include "protected_region.hpp"
#include "text_scan.hpp"

#include <re2/re2.h>

#include <charconv>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace prepress {

bool number_footnotes(node_tree& tree, const node_id root)
{
    static const RE2 marker{R"(\[(\d*)\])"};

    footnote_numberer numberer;

    for (const node_id text_id :
        unprotected_text_nodes(tree, root, region::verbatim))
    {
        const bool ok = splice_matches(tree, text_id, marker,
            [&](const text_match& match) -> std::optional<node_id>
            {
                const std::string_view digits = match.group(1);

                std::optional<std::size_t> explicit_number;
                if (!digits.empty())
                {
                    std::size_t value = 0;
                    const auto [ptr, ec] = std::from_chars(
                        digits.data(), digits.data() + digits.size(), value);

                    // The largest value has no successor to continue the
                    // sequence with.
                    if (ec != std::errc{} ||
                        ptr != digits.data() + digits.size() ||
                        value == std::numeric_limits<std::size_t>::max())
                    {
                        // Not a footnote we can number; keep it literal.
                        return std::nullopt;
                    }

                    explicit_number = value;
                }

                const std::size_t number = numberer.next(explicit_number);

                const node_id sup = tree.create_element("sup");
                const node_id text = tree.create_text(std::to_string(number));

                if (!tree.append_child(sup, text))
                {
                    return std::nullopt;
                }

                return {sup};
            });

        if (!ok)
        {
            return false;
        }
    }

    return true;
}

} // namespace prepress
