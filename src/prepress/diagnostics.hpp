#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

namespace prepress {

// Prefixed diagnostics for one article:
//
//     ((<KIND> ERROR))(<article id>): <message>
//     ((PREPRESS NOTE))(<article id>): <message>
class diagnostics
{
private:
    std::ostream& _err_stream;
    std::string _article_id;

public:
    [[nodiscard]] explicit diagnostics(
        std::ostream& err_stream, const std::string_view article_id);

    [[nodiscard]] std::ostream& error_stream(const std::string_view kind);

    [[nodiscard]] std::ostream& note_stream();

    // A collaborator failed on `literal`; the match stays unconverted.
    void collaborator_failure(const std::string_view kind,
        const std::string_view what, const std::string_view literal,
        const std::string_view reason);
};

} // namespace prepress
