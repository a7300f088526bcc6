#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prepress {

struct code_option
{
    std::string _name;
    std::string _value; // empty for flag options such as `:linenos:`
};

using code_options = std::vector<code_option>;

[[nodiscard]] std::optional<std::string_view> find_code_option(
    const code_options& options, const std::string_view name) noexcept;

// Everything the pipeline needs from the outside world. Passes only ever talk
// to the network, the filesystem or external compilers through this
// interface.
class collaborators
{
public:
    struct error
    {
        std::string _reason;
    };

    virtual ~collaborators() = default;

    // Retrieves the resource at `url` into `output_buffer`.
    [[nodiscard]] virtual std::optional<error> fetch_resource(
        std::string& output_buffer, const std::string_view url) = 0;

    // Stores `bytes` at `path`. Raster images may be resized on the way.
    [[nodiscard]] virtual std::optional<error> store_asset(
        const std::string_view path, const std::string_view bytes) = 0;

    // Compiles `source` (without delimiters) and writes the path of the
    // resulting artifact, derived from `artifact_stem`, to `output_path`.
    [[nodiscard]] virtual std::optional<error> compile_math(
        std::string& output_path, const std::string_view source,
        const bool display_mode, const std::string_view artifact_stem) = 0;

    // Produces markup for `source`. The text content of the markup must be
    // exactly `source`; only wrapper elements may be added.
    [[nodiscard]] virtual std::optional<error> highlight_code(
        std::string& output_markup, const std::string_view source,
        const code_options& options) = 0;
};

// No network, no compiler: every I/O operation fails, highlighting escapes
// the source unchanged.
class offline_collaborators : public collaborators
{
public:
    [[nodiscard]] std::optional<error> fetch_resource(
        std::string& output_buffer, const std::string_view url) override;

    [[nodiscard]] std::optional<error> store_asset(
        const std::string_view path, const std::string_view bytes) override;

    [[nodiscard]] std::optional<error> compile_math(std::string& output_path,
        const std::string_view source, const bool display_mode,
        const std::string_view artifact_stem) override;

    [[nodiscard]] std::optional<error> highlight_code(
        std::string& output_markup, const std::string_view source,
        const code_options& options) override;
};

} // namespace prepress
