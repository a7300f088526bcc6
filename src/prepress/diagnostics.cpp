#include "diagnostics.hpp"

#include <ostream>
#include <string>
#include <string_view>

namespace prepress {

diagnostics::diagnostics(
    std::ostream& err_stream, const std::string_view article_id)
    : _err_stream{err_stream}, _article_id{article_id}
{}

std::ostream& diagnostics::error_stream(const std::string_view kind)
{
    return _err_stream << "((" << kind << " ERROR))(" << _article_id << "): ";
}

std::ostream& diagnostics::note_stream()
{
    return _err_stream << "((PREPRESS NOTE))(" << _article_id << "): ";
}

void diagnostics::collaborator_failure(const std::string_view kind,
    const std::string_view what, const std::string_view literal,
    const std::string_view reason)
{
    error_stream(kind) << what << " '" << literal << "' (" << reason
                       << ")\n\n";
}

} // namespace prepress
