#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace prepress {

struct article;
class collaborators;

class pipeline
{
private:
    std::ostream& _err_stream;
    collaborators& _collaborators;

public:
    struct config
    {
        std::string asset_dir = "assets";
        bool skip_embeds = false;
        bool skip_media = false;
        bool skip_math = false;
        bool skip_code_highlighting = false;
    };

    // A pass left the tree in a state it could not continue from.
    struct error
    {
        std::string_view _pass;
    };

    [[nodiscard]] explicit pipeline(
        std::ostream& err_stream, collaborators& collaborators);

    ~pipeline();

    // Merges the postscript, runs every pass in order and attaches the
    // author byline. Collaborator failures are reported and skipped; a
    // structural failure aborts this article and is returned.
    [[nodiscard]] std::optional<error> process(
        const config& cfg, article& target) noexcept;

    // Processes articles one after the other. Returns the number of articles
    // that were aborted.
    [[nodiscard]] std::size_t process_all(
        const config& cfg, std::span<article> targets) noexcept;
};

} // namespace prepress
