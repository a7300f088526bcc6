#include "article.hpp"

#include "node_tree.hpp"
#include "protected_region.hpp"
#include "tag.hpp"
#include "utf8.hpp"

#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prepress {

namespace {

[[nodiscard]] std::optional<node_id> find_footer(const node_tree& tree)
{
    for (const node_id id : tree.descendants(tree.root()))
    {
        if (tag_of(tree, id) == tag::footer)
        {
            return {id};
        }
    }

    return std::nullopt;
}

void append_path_component(std::string& path, const std::string_view component)
{
    if (!path.empty() && path.back() != '/')
    {
        path.push_back('/');
    }

    path.append(component);
}

} // namespace

bool article::merge_postscript()
{
    if (_postscript == null_node)
    {
        return true;
    }

    const node_id footer = _content.create_element("footer");
    const node_id separator = _content.create_text("\n");

    if (!_content.append_child(footer, _postscript) ||
        !_content.append_child(_content.root(), separator) ||
        !_content.append_child(_content.root(), footer))
    {
        return false;
    }

    _postscript = null_node;
    return true;
}

bool article::attach_author()
{
    if (_author.empty())
    {
        return true;
    }

    const node_id address = _content.create_element("address");
    if (!_content.append_child(address, _content.create_text(_author)))
    {
        return false;
    }

    const node_id separator = _content.create_text("\n");
    const std::optional<node_id> footer = find_footer(_content);

    if (!footer.has_value())
    {
        return _content.append_child(_content.root(), separator) &&
               _content.append_child(_content.root(), address);
    }

    const node_id footer_parent = _content.parent(*footer);
    const std::optional<std::size_t> idx = _content.index_in_parent(*footer);

    if (!idx.has_value())
    {
        return false;
    }

    return _content.insert_child(footer_parent, *idx, address) &&
           _content.insert_child(footer_parent, *idx + 1, separator);
}

std::string article::slug() const
{
    const std::u32string title = decode_utf8(_title);

    std::string result;
    for (std::size_t i = 0; i < title.size() && i < 10; ++i)
    {
        const char32_t c = title[i];

        if (c == U' ' || c == U'_')
        {
            result.push_back('_');
        }
        else if ((c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z') ||
                 (c >= U'0' && c <= U'9'))
        {
            result.push_back(static_cast<char>(c));
        }
    }

    result.push_back('_');
    result.append(_id);
    return result;
}

std::string article::image_location(const std::string_view asset_dir,
    const std::string_view file, const std::size_t index) const
{
    char index_buffer[16];
    std::snprintf(index_buffer, sizeof(index_buffer), "%03zu", index);

    std::string filename = slug();
    filename.push_back('_');
    filename.append(index_buffer);
    filename.push_back('_');
    filename.append(file);

    std::string result{asset_dir};
    append_path_component(result, "img");
    append_path_component(result, filename);
    return result;
}

std::string article::math_location(
    const std::string_view asset_dir, const std::string_view stem) const
{
    std::string filename = slug();
    filename.push_back('_');
    filename.append(stem);

    std::string result{asset_dir};
    append_path_component(result, "pdf");
    append_path_component(result, filename);
    return result;
}

} // namespace prepress
