#include "passes.hpp"

#include "article.hpp"
#include "collaborators.hpp"
#include "markup.hpp"
#include "node_tree.hpp"
#include "protected_region.hpp"
#include "tag.hpp"
#include "text_scan.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace prepress {

namespace {

using namespace std::string_view_literals;

constexpr std::string_view imgur_url_pattern{
    R"((?:https?:)?//(?:i\.)?imgur\.com/(a/|gallery/)?(\w{5}(?:\w\w)*).?(\.\w+)?)"};

// A whole image source URL, optionally followed by a query or fragment.
// Groups: 1 = scheme (`a/`, `gallery/`), 2 = hash, 3 = extension.
[[nodiscard]] const RE2& imgur_source_regex()
{
    static const RE2 regex{
        std::string{imgur_url_pattern} + R"((?:[?#].*)?)"};

    return regex;
}

// Groups as above.
[[nodiscard]] const RE2& imgur_embed_regex()
{
    static const RE2 regex{
        std::string{R"(\[embed\])"} + std::string{imgur_url_pattern} +
        R"(\[/embed\])"};

    return regex;
}

[[nodiscard]] std::string direct_imgur_url(
    const std::string_view hash, const std::string_view ext)
{
    std::string result{"https://i.imgur.com/"};
    result.append(hash);
    result.append(ext);
    return result;
}

[[nodiscard]] bool has_class(const node_tree& tree, const node_id id,
    const std::string_view class_name) noexcept
{
    const std::optional<std::string_view> classes =
        tree.attribute_value(id, "class");

    if (!classes.has_value())
    {
        return false;
    }

    std::size_t pos = 0;
    while (pos < classes->size())
    {
        const std::size_t end = std::min(classes->find(' ', pos), classes->size());

        if (classes->substr(pos, end - pos) == class_name)
        {
            return true;
        }

        pos = end + 1;
    }

    return false;
}

// Finds the source of the `img.post` element inside `#image` in an embed
// page.
[[nodiscard]] std::optional<std::string> find_embedded_image_source(
    const std::string_view page)
{
    node_tree scratch;
    if (!read_markup(scratch, scratch.root(), page))
    {
        return std::nullopt;
    }

    for (const node_id id : scratch.descendants(scratch.root()))
    {
        if (scratch.attribute_value(id, "id") != "image"sv)
        {
            continue;
        }

        for (const node_id inner : scratch.descendants(id))
        {
            if (tag_of(scratch, inner) != tag::img ||
                !has_class(scratch, inner, "post"))
            {
                continue;
            }

            if (const auto src = scratch.attribute_value(inner, "src");
                src.has_value())
            {
                return {std::string{*src}};
            }
        }
    }

    return std::nullopt;
}

// Resolves an extension-less gallery link through its embed page.
[[nodiscard]] std::optional<std::string> resolve_imgur_gallery(
    const text_match& match, pass_context& ctx)
{
    std::string embed_url{"https://imgur.com/"};
    embed_url.append(match.group(1));
    embed_url.append(match.group(2));
    embed_url.append("/embed?pub=true");

    std::string page;
    if (const auto err = ctx._collaborators.fetch_resource(page, embed_url);
        err.has_value())
    {
        ctx._diagnostics.collaborator_failure("FETCH",
            "Error downloading Imgur gallery", match.literal(), err->_reason);

        return std::nullopt;
    }

    const std::optional<std::string> src = find_embedded_image_source(page);

    std::string hash;
    std::string ext;

    if (!src.has_value() ||
        !RE2::FullMatch(*src, imgur_source_regex(), nullptr, &hash, &ext))
    {
        ctx._diagnostics.collaborator_failure("FETCH",
            "Error downloading Imgur gallery", match.literal(),
            "could not find image source in returned webpage");

        return std::nullopt;
    }

    return {direct_imgur_url(hash, ext)};
}

// Last path component of `url`, ignoring query and fragment.
[[nodiscard]] std::string_view url_basename(const std::string_view url) noexcept
{
    std::string_view path = url;

    if (const std::size_t scheme = path.find("://");
        scheme != std::string_view::npos)
    {
        path.remove_prefix(scheme + 3);

        const std::size_t slash = path.find('/');
        path.remove_prefix(slash == std::string_view::npos ? path.size() : slash);
    }

    path = path.substr(0, path.find_first_of("?#"));

    const std::size_t last_slash = path.rfind('/');
    return last_slash == std::string_view::npos ? path
                                                : path.substr(last_slash + 1);
}

// 64-bit FNV-1a, as lowercase hex. Gives every distinct math literal a
// stable artifact name across runs.
[[nodiscard]] std::string hash_hex(const std::string_view data)
{
    std::uint64_t hash = 14695981039346656037ull;

    for (const char c : data)
    {
        hash ^= static_cast<unsigned char>(c);
        hash *= 1099511628211ull;
    }

    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx",
        static_cast<unsigned long long>(hash));

    return std::string{buffer};
}

[[nodiscard]] node_id make_file_link(node_tree& tree, const std::string_view path)
{
    std::string href{"file://"};
    href.append(path);

    const node_id link = tree.create_element("link");
    tree.set_attribute(link, "href", href);
    return link;
}

} // namespace

bool convert_imgur_embeds(article& a, pass_context& ctx)
{
    if (ctx._config.skip_embeds)
    {
        return true;
    }

    node_tree& tree = a._content;

    for (const node_id text_id :
        unprotected_text_nodes(tree, tree.root(), region::verbatim))
    {
        const bool ok = splice_matches(tree, text_id, imgur_embed_regex(),
            [&](const text_match& match) -> std::optional<node_id>
            {
                std::optional<std::string> url;

                if (match.has_group(3))
                {
                    url = direct_imgur_url(match.group(2), match.group(3));
                }
                else
                {
                    url = resolve_imgur_gallery(match, ctx);
                }

                if (!url.has_value())
                {
                    return std::nullopt;
                }

                const node_id img = tree.create_element("img");
                tree.set_attribute(img, "src", *url);
                return {img};
            });

        if (!ok)
        {
            return false;
        }
    }

    return true;
}

bool download_images(article& a, pass_context& ctx)
{
    if (ctx._config.skip_media)
    {
        return true;
    }

    node_tree& tree = a._content;
    std::size_t index = 0;

    for (const node_id id : tree.descendants(tree.root()))
    {
        if (tag_of(tree, id) != tag::img)
        {
            continue;
        }

        // Every image counts towards the index, even one without a source.
        const std::size_t image_index = index++;

        const std::optional<std::string_view> src_view =
            tree.attribute_value(id, "src");

        if (!src_view.has_value())
        {
            continue;
        }

        const std::string src{*src_view};
        const std::string local_path =
            a.image_location(ctx._config.asset_dir, url_basename(src), image_index);

        std::string bytes;
        if (const auto err = ctx._collaborators.fetch_resource(bytes, src);
            err.has_value())
        {
            ctx._diagnostics.collaborator_failure(
                "FETCH", "Error downloading image", src, err->_reason);

            continue;
        }

        if (const auto err = ctx._collaborators.store_asset(local_path, bytes);
            err.has_value())
        {
            ctx._diagnostics.collaborator_failure(
                "FETCH", "Error storing image", src, err->_reason);

            continue;
        }

        std::string href{"file://"};
        href.append(local_path);

        tree.rename(id, "link");
        tree.set_attribute(id, "href", href);
    }

    return true;
}

bool compile_latex(article& a, pass_context& ctx)
{
    if (ctx._config.skip_math)
    {
        return true;
    }

    static const RE2 math_regex{R"(\\[(\[]([\s\S]+?)\\[)\]])"};

    node_tree& tree = a._content;

    // Sources that failed to compile once are not retried.
    std::unordered_map<std::string, bool> valid_memo;

    // Literal -> artifact path.
    std::unordered_map<std::string, std::string> compiled_memo;

    for (const node_id text_id :
        unprotected_text_nodes(tree, tree.root(), region::verbatim))
    {
        const bool ok = splice_matches(tree, text_id, math_regex,
            [&](const text_match& match) -> std::optional<node_id>
            {
                const std::string literal{match.literal()};
                const std::string source{match.group(1)};

                if (const auto it = valid_memo.find(source);
                    it != valid_memo.end() && !it->second)
                {
                    return std::nullopt;
                }

                auto it = compiled_memo.find(literal);
                if (it == compiled_memo.end())
                {
                    const bool display_mode = literal[1] == '[';
                    const std::string stem =
                        a.math_location(ctx._config.asset_dir, hash_hex(literal));

                    std::string output_path;
                    if (const auto err = ctx._collaborators.compile_math(
                            output_path, source, display_mode, stem);
                        err.has_value())
                    {
                        valid_memo[source] = false;

                        ctx._diagnostics.collaborator_failure(
                            "MATH", "Could not compile", literal, err->_reason);

                        return std::nullopt;
                    }

                    valid_memo[source] = true;
                    it = compiled_memo.emplace(literal, output_path).first;
                }

                return {make_file_link(tree, it->second)};
            });

        if (!ok)
        {
            return false;
        }
    }

    return true;
}

} // namespace prepress
