#pragma once

#include "node_tree.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace prepress {

// One exported article. The importer fills in the metadata and builds the
// content under `_content.root()`; a postscript, if any, is built in the same
// arena as a detached element and referenced by `_postscript`.
struct article
{
    std::string _title;
    std::string _subtitle;
    std::string _author;
    std::string _id;

    node_tree _content;
    node_id _postscript{null_node};

    // Moves the postscript to the end of the content, wrapped in a `footer`
    // and preceded by a newline. No-op without a postscript.
    [[nodiscard]] bool merge_postscript();

    // Inserts the author as an `address` element in front of the `footer`,
    // or at the end of the content if there is none. No-op without an author.
    [[nodiscard]] bool attach_author();

    // First ten characters of the title reduced to ASCII word characters,
    // followed by `_<id>`. Keeps asset names from colliding across articles.
    [[nodiscard]] std::string slug() const;

    // `<asset_dir>/img/<slug>_<index:03>_<file>`
    [[nodiscard]] std::string image_location(const std::string_view asset_dir,
        const std::string_view file, const std::size_t index) const;

    // `<asset_dir>/pdf/<slug>_<stem>`
    [[nodiscard]] std::string math_location(
        const std::string_view asset_dir, const std::string_view stem) const;
};

} // namespace prepress
