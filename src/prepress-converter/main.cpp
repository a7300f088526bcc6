#include <prepress/article.hpp>
#include <prepress/bracket_markup.hpp>
#include <prepress/js_highlighter.hpp>
#include <prepress/markup.hpp>
#include <prepress/pipeline.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace {

// Recognizes `--<name>=<value>` and stores the value.
[[nodiscard]] bool read_flag(const std::string_view arg,
    const std::string_view name, std::string& value)
{
    if (arg.size() < name.size() + 3 || arg.substr(0, 2) != "--" ||
        arg.substr(2, name.size()) != name || arg[name.size() + 2] != '=')
    {
        return false;
    }

    value = arg.substr(name.size() + 3);
    return true;
}

} // namespace

// Usage:
//
//     prepress-converter [--title=T] [--subtitle=S] [--author=A] [--id=I]
//                        [--assets=DIR] [--highlighter=SCRIPT.js] < article
//
// Reads one article body (tag markup, bracket shortcodes allowed) from
// standard input and writes the processed markup to standard output.
int main(int argc, char** argv)
{
    std::ios_base::sync_with_stdio(false);
    std::cin.tie(nullptr);

    prepress::article article;
    std::string highlighter_path;
    std::string asset_dir{"assets"};

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};

        if (!read_flag(arg, "title", article._title) &&
            !read_flag(arg, "subtitle", article._subtitle) &&
            !read_flag(arg, "author", article._author) &&
            !read_flag(arg, "id", article._id) &&
            !read_flag(arg, "assets", asset_dir) &&
            !read_flag(arg, "highlighter", highlighter_path))
        {
            std::cerr << "((PREPRESS ERROR))(?): Unknown argument '" << arg
                      << "'\n"
                      << std::endl;

            return 1;
        }
    }

    std::string input_buffer;
    input_buffer.reserve(128000);

    std::string line_buffer;
    line_buffer.reserve(512);

    while (std::getline(std::cin, line_buffer))
    {
        input_buffer.append(line_buffer);
        input_buffer.append(1, '\n');
    }

    if (!prepress::read_markup(article._content, article._content.root(),
            prepress::expand_bracket_markup(input_buffer)))
    {
        std::cerr << "((PREPRESS ERROR))(" << article._id
                  << "): Could not build the document tree\n"
                  << std::endl;

        return 1;
    }

    prepress::js_highlighter highlighter{std::cerr};

    if (!highlighter_path.empty())
    {
        std::ifstream ifs(highlighter_path);
        if (!ifs)
        {
            std::cerr << "((PREPRESS ERROR))(" << article._id
                      << "): Could not open highlighter script '"
                      << highlighter_path << "'\n"
                      << std::endl;

            return 1;
        }

        std::ostringstream script;
        script << ifs.rdbuf();

        if (const auto err = highlighter.load_script(script.str());
            err.has_value())
        {
            std::cerr << "((PREPRESS ERROR))(" << article._id
                      << "): Highlighter script failed at line " << err->_line
                      << "\n"
                      << std::endl;

            return 1;
        }
    }

    // The tool has no network or LaTeX toolchain behind it.
    const prepress::pipeline::config cfg{
        .asset_dir = asset_dir,
        .skip_embeds = true,
        .skip_media = true,
        .skip_math = true,
        .skip_code_highlighting = highlighter_path.empty() //
    };

    prepress::pipeline pipeline{std::cerr, highlighter};

    if (const auto err = pipeline.process(cfg, article); err.has_value())
    {
        std::cerr << "((PREPRESS ERROR))(" << article._id
                  << "): Fatal error during prepress conversion process ("
                  << err->_pass << ")\n"
                  << std::endl;

        return 2;
    }

    std::cout << prepress::inner_markup(article._content, article._content.root())
              << std::endl;

    return 0;
}
