#pragma once

#include "node_tree.hpp"
#include "protected_region.hpp"
#include "span_splicer.hpp"

#include <re2/re2.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prepress {

// One match of a pattern against the original content of a text node.
class text_match
{
private:
    std::string_view _source;
    const std::vector<re2::StringPiece>& _groups;

public:
    [[nodiscard]] explicit text_match(const std::string_view source,
        const std::vector<re2::StringPiece>& groups) noexcept
        : _source{source}, _groups{groups}
    {}

    [[nodiscard]] std::string_view group(const std::size_t i) const noexcept
    {
        if (i >= _groups.size() || _groups[i].data() == nullptr)
        {
            return {};
        }

        return {_groups[i].data(), _groups[i].size()};
    }

    [[nodiscard]] bool has_group(const std::size_t i) const noexcept
    {
        return i < _groups.size() && _groups[i].data() != nullptr;
    }

    [[nodiscard]] std::string_view literal() const noexcept
    {
        return group(0);
    }

    [[nodiscard]] std::size_t begin() const noexcept
    {
        return static_cast<std::size_t>(_groups[0].data() - _source.data());
    }

    [[nodiscard]] std::size_t end() const noexcept
    {
        return begin() + _groups[0].size();
    }
};

// Snapshot, in document order, of the text nodes under `root` that are not
// inside a `r` region.
[[nodiscard]] std::vector<node_id> unprotected_text_nodes(
    const node_tree& tree, const node_id root, const region r);

// Replaces every occurrence of `from` in `target` with `to`.
void replace_all(std::string& target, const std::string_view from,
    const std::string_view to);

// Scans the original content of `text_id` for `pattern` and splices the node
// returned by `make_replacement` over each match. A `std::nullopt`
// replacement leaves that match as literal text. Returns `false` only if a
// splice broke a tree invariant.
template <typename F>
[[nodiscard]] bool splice_matches(node_tree& tree, const node_id text_id,
    const RE2& pattern, F&& make_replacement)
{
    // Copy: the node is replaced as soon as the first match is spliced.
    const std::string source = tree.text(text_id);
    const re2::StringPiece source_sp{source.data(), source.size()};

    const int n_groups = 1 + pattern.NumberOfCapturingGroups();
    std::vector<re2::StringPiece> groups(static_cast<std::size_t>(n_groups));

    node_id curr = text_id;
    std::size_t curr_offset = 0;
    std::size_t pos = 0;

    while (curr != null_node && pos <= source.size())
    {
        if (!pattern.Match(source_sp, pos, source.size(), RE2::UNANCHORED,
                groups.data(), n_groups))
        {
            break;
        }

        const text_match match{source, groups};
        const std::size_t match_begin = match.begin();
        const std::size_t match_end = match.end();

        const std::optional<node_id> replacement = make_replacement(match);
        if (replacement.has_value())
        {
            const std::optional<node_id> suffix =
                splice(tree, curr, match_begin - curr_offset,
                    match_end - curr_offset, *replacement);

            if (!suffix.has_value())
            {
                return false;
            }

            curr = *suffix;
            curr_offset = match_end;
        }

        pos = match_end > match_begin ? match_end : match_end + 1;
    }

    return true;
}

} // namespace prepress
