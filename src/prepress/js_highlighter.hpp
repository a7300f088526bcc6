#pragma once

#include "collaborators.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace prepress {

// Code highlighting driven by a user script. The script is evaluated once
// and must define
//
//     function prepress_highlight(code, lang, options) { ... }
//
// returning markup whose text content is `code`. Scripts may pull in other
// files with `prepress_include(path)`. All other collaborator operations
// behave like `offline_collaborators`.
class js_highlighter : public offline_collaborators
{
private:
    struct impl;
    std::unique_ptr<impl> _impl;

public:
    struct script_error
    {
        std::size_t _line;
    };

    [[nodiscard]] explicit js_highlighter(std::ostream& err_stream);
    ~js_highlighter() override;

    [[nodiscard]] std::optional<script_error> load_script(
        const std::string_view source) noexcept;

    [[nodiscard]] std::optional<error> highlight_code(
        std::string& output_markup, const std::string_view source,
        const code_options& options) override;
};

} // namespace prepress
