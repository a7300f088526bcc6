#include "pipeline.hpp"

#include "article.hpp"
#include "collaborators.hpp"
#include "diagnostics.hpp"
#include "passes.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <span>
#include <string_view>

namespace prepress {

namespace {

constexpr std::string_view merge_postscript_step{"merge postscript"};
constexpr std::string_view attach_author_step{"attach author"};

[[nodiscard]] pipeline::error report_structural_failure(
    diagnostics& diag, const std::string_view step)
{
    diag.error_stream("PREPRESS")
        << "structural failure in pass '" << step << "'\n\n";

    return pipeline::error{._pass = step};
}

} // namespace

pipeline::pipeline(std::ostream& err_stream, collaborators& collaborators)
    : _err_stream{err_stream}, _collaborators{collaborators}
{}

pipeline::~pipeline() = default;

std::optional<pipeline::error> pipeline::process(
    const config& cfg, article& target) noexcept
{
    diagnostics diag{_err_stream, target._id};

    pass_context ctx{
        ._config = cfg, ._collaborators = _collaborators, ._diagnostics = diag};

    if (!target.merge_postscript())
    {
        return report_structural_failure(diag, merge_postscript_step);
    }

    for (const pass& p : pass_catalog())
    {
        if (!p._fn(target, ctx))
        {
            return report_structural_failure(diag, p._name);
        }
    }

    if (!target.attach_author())
    {
        return report_structural_failure(diag, attach_author_step);
    }

    return std::nullopt;
}

std::size_t pipeline::process_all(
    const config& cfg, std::span<article> targets) noexcept
{
    std::size_t n_aborted = 0;

    for (article& target : targets)
    {
        if (process(cfg, target).has_value())
        {
            ++n_aborted;
        }
    }

    return n_aborted;
}

} // namespace prepress
