#include "collaborators.hpp"

#include "markup.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace prepress {

std::optional<std::string_view> find_code_option(
    const code_options& options, const std::string_view name) noexcept
{
    for (const code_option& option : options)
    {
        if (option._name == name)
        {
            return {option._value};
        }
    }

    return std::nullopt;
}

std::optional<collaborators::error> offline_collaborators::fetch_resource(
    std::string& output_buffer, const std::string_view url)
{
    (void)output_buffer;
    (void)url;

    return error{._reason = "offline, no resource fetching available"};
}

std::optional<collaborators::error> offline_collaborators::store_asset(
    const std::string_view path, const std::string_view bytes)
{
    (void)path;
    (void)bytes;

    return error{._reason = "offline, no asset storage available"};
}

std::optional<collaborators::error> offline_collaborators::compile_math(
    std::string& output_path, const std::string_view source,
    const bool display_mode, const std::string_view artifact_stem)
{
    (void)output_path;
    (void)source;
    (void)display_mode;
    (void)artifact_stem;

    return error{._reason = "offline, no LaTeX compiler available"};
}

std::optional<collaborators::error> offline_collaborators::highlight_code(
    std::string& output_markup, const std::string_view source,
    const code_options& options)
{
    (void)options;

    output_markup.append(escape_markup(source));
    return std::nullopt;
}

} // namespace prepress
