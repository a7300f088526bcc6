#include "markup.hpp"

#include "node_tree.hpp"
#include "utf8.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cassert>
#include <cstddef>

namespace prepress {

namespace {

using namespace std::string_view_literals;

[[nodiscard]] bool is_name_char(const char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-' || c == ':' ||
           c == '.';
}

[[nodiscard]] bool is_space(const char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

[[nodiscard]] bool is_void_element(const std::string_view name) noexcept
{
    return name == "img"sv || name == "br"sv || name == "hr"sv;
}

[[nodiscard]] std::optional<char32_t> parse_numeric_entity(
    const std::string_view body) noexcept
{
    // `body` is what follows "&#"
    if (body.empty())
    {
        return std::nullopt;
    }

    const bool hex = body[0] == 'x' || body[0] == 'X';
    const std::string_view digits = hex ? body.substr(1) : body;

    if (digits.empty() || digits.size() > 8)
    {
        return std::nullopt;
    }

    char32_t result = 0;
    for (const char c : digits)
    {
        unsigned value = 0;

        if (c >= '0' && c <= '9')
        {
            value = static_cast<unsigned>(c - '0');
        }
        else if (hex && c >= 'a' && c <= 'f')
        {
            value = static_cast<unsigned>(c - 'a' + 10);
        }
        else if (hex && c >= 'A' && c <= 'F')
        {
            value = static_cast<unsigned>(c - 'A' + 10);
        }
        else
        {
            return std::nullopt;
        }

        result = result * (hex ? 16 : 10) + value;
    }

    if (result == 0 || result > 0x10FFFF)
    {
        return std::nullopt;
    }

    return {result};
}

void append_decoded(std::string& output, const std::string_view source)
{
    std::size_t i = 0;
    while (i < source.size())
    {
        if (source[i] != '&')
        {
            output.push_back(source[i]);
            ++i;
            continue;
        }

        const std::size_t semi = source.find(';', i);
        if (semi == std::string_view::npos || semi - i > 10)
        {
            output.push_back('&');
            ++i;
            continue;
        }

        const std::string_view name = source.substr(i + 1, semi - i - 1);

        if (name == "amp"sv)
        {
            output.push_back('&');
        }
        else if (name == "lt"sv)
        {
            output.push_back('<');
        }
        else if (name == "gt"sv)
        {
            output.push_back('>');
        }
        else if (name == "quot"sv)
        {
            output.push_back('"');
        }
        else if (name == "apos"sv)
        {
            output.push_back('\'');
        }
        else if (name == "nbsp"sv)
        {
            append_utf8(output, 0x00A0);
        }
        else if (!name.empty() && name[0] == '#' &&
                 parse_numeric_entity(name.substr(1)).has_value())
        {
            append_utf8(output, *parse_numeric_entity(name.substr(1)));
        }
        else
        {
            output.push_back('&');
            ++i;
            continue;
        }

        i = semi + 1;
    }
}

class markup_reader
{
private:
    node_tree& _tree;
    const std::string_view _source;
    std::size_t _curr_idx;
    std::vector<node_id> _open;
    std::string _text_buffer;

    [[nodiscard]] bool is_done() const noexcept
    {
        return _curr_idx >= _source.size();
    }

    [[nodiscard]] std::optional<char> peek(const std::size_t n_steps) const
    {
        if (_curr_idx + n_steps >= _source.size())
        {
            return std::nullopt;
        }

        return _source[_curr_idx + n_steps];
    }

    [[nodiscard]] node_id current_parent() const noexcept
    {
        assert(!_open.empty());
        return _open.back();
    }

    [[nodiscard]] bool flush_text()
    {
        if (_text_buffer.empty())
        {
            return true;
        }

        const node_id text = _tree.create_text(_text_buffer);
        _text_buffer.clear();

        return _tree.append_child(current_parent(), text);
    }

    void read_literal_char()
    {
        _text_buffer.push_back(_source[_curr_idx]);
        ++_curr_idx;
    }

    void read_text_run()
    {
        const std::size_t end = _source.find('<', _curr_idx);
        const std::size_t stop = end == std::string_view::npos ? _source.size() : end;

        append_decoded(
            _text_buffer, _source.substr(_curr_idx, stop - _curr_idx));

        _curr_idx = stop;
    }

    [[nodiscard]] std::string_view read_name()
    {
        const std::size_t start = _curr_idx;
        while (!is_done() && is_name_char(_source[_curr_idx]))
        {
            ++_curr_idx;
        }

        return _source.substr(start, _curr_idx - start);
    }

    void skip_spaces()
    {
        while (!is_done() && is_space(_source[_curr_idx]))
        {
            ++_curr_idx;
        }
    }

    void skip_comment()
    {
        const std::size_t end = _source.find("-->", _curr_idx + 4);
        _curr_idx = end == std::string_view::npos ? _source.size() : end + 3;
    }

    [[nodiscard]] std::string read_attribute_value()
    {
        std::string result;

        if (is_done())
        {
            return result;
        }

        const char quote = _source[_curr_idx];
        if (quote == '"' || quote == '\'')
        {
            const std::size_t end = _source.find(quote, _curr_idx + 1);
            const std::size_t stop =
                end == std::string_view::npos ? _source.size() : end;

            append_decoded(
                result, _source.substr(_curr_idx + 1, stop - _curr_idx - 1));

            _curr_idx = stop == _source.size() ? stop : stop + 1;
            return result;
        }

        const std::size_t start = _curr_idx;
        while (!is_done() && !is_space(_source[_curr_idx]) &&
               _source[_curr_idx] != '>' &&
               !(_source[_curr_idx] == '/' && peek(1) == '>'))
        {
            ++_curr_idx;
        }

        append_decoded(result, _source.substr(start, _curr_idx - start));
        return result;
    }

    [[nodiscard]] bool read_closing_tag()
    {
        _curr_idx += 2; // "</"
        const std::string name{read_name()};

        const std::size_t end = _source.find('>', _curr_idx);
        _curr_idx = end == std::string_view::npos ? _source.size() : end + 1;

        if (!flush_text())
        {
            return false;
        }

        // Close up to the nearest matching element; ignore strays.
        for (std::size_t i = _open.size(); i-- > 1;)
        {
            if (_tree.name(_open[i]) == name)
            {
                _open.resize(i);
                break;
            }
        }

        return true;
    }

    [[nodiscard]] bool read_opening_tag()
    {
        ++_curr_idx; // '<'
        const std::string name{read_name()};

        if (!flush_text())
        {
            return false;
        }

        const node_id element = _tree.create_element(name);
        bool self_closing = is_void_element(name);

        while (true)
        {
            skip_spaces();

            if (is_done())
            {
                break;
            }

            if (_source[_curr_idx] == '>')
            {
                ++_curr_idx;
                break;
            }

            if (_source[_curr_idx] == '/' && peek(1) == '>')
            {
                _curr_idx += 2;
                self_closing = true;
                break;
            }

            const std::string attr_name{read_name()};
            if (attr_name.empty())
            {
                // Junk inside the tag.
                ++_curr_idx;
                continue;
            }

            skip_spaces();

            std::string attr_value;
            if (!is_done() && _source[_curr_idx] == '=')
            {
                ++_curr_idx;
                skip_spaces();
                attr_value = read_attribute_value();
            }

            _tree.set_attribute(element, attr_name, attr_value);
        }

        if (!_tree.append_child(current_parent(), element))
        {
            return false;
        }

        if (!self_closing)
        {
            _open.push_back(element);
        }

        return true;
    }

    [[nodiscard]] bool read_step()
    {
        if (_source[_curr_idx] != '<')
        {
            read_text_run();
            return true;
        }

        const std::optional<char> next = peek(1);

        if (next == '!' && _source.substr(_curr_idx, 4) == "<!--"sv)
        {
            skip_comment();
            return true;
        }

        if (next == '/' && peek(2).has_value() && is_name_char(*peek(2)))
        {
            return read_closing_tag();
        }

        if (next.has_value() && is_name_char(*next) && *next != '-' &&
            *next != '.')
        {
            return read_opening_tag();
        }

        read_literal_char();
        return true;
    }

public:
    [[nodiscard]] explicit markup_reader(
        node_tree& tree, const node_id parent, const std::string_view source)
        : _tree{tree}, _source{source}, _curr_idx{0}, _open{parent}
    {}

    [[nodiscard]] bool read()
    {
        while (!is_done())
        {
            if (!read_step())
            {
                return false;
            }
        }

        return flush_text();
    }
};

void write_markup(std::string& output, const node_tree& tree, const node_id id)
{
    if (tree.is_text(id))
    {
        output.append(escape_markup(tree.text(id)));
        return;
    }

    const std::string& name = tree.name(id);

    output.push_back('<');
    output.append(name);

    for (const attribute& attr : tree.attributes(id))
    {
        output.push_back(' ');
        output.append(attr._name);
        output.append("=\"");
        output.append(escape_markup(attr._value, true /* in_attribute */));
        output.push_back('"');
    }

    if (tree.children(id).empty())
    {
        output.append("/>");
        return;
    }

    output.push_back('>');

    for (const node_id child : tree.children(id))
    {
        write_markup(output, tree, child);
    }

    output.append("</");
    output.append(name);
    output.push_back('>');
}

} // namespace

bool read_markup(
    node_tree& tree, const node_id parent, const std::string_view source)
{
    if (!tree.is_element(parent))
    {
        return false;
    }

    return markup_reader{tree, parent, source}.read();
}

std::string escape_markup(
    const std::string_view source, const bool in_attribute)
{
    std::string result;
    result.reserve(source.size());

    for (const char c : source)
    {
        switch (c)
        {
            case '&': result.append("&amp;"); break;
            case '<': result.append("&lt;"); break;
            case '>': result.append("&gt;"); break;
            case '"':
                result.append(in_attribute ? "&quot;" : "\"");
                break;
            default: result.push_back(c); break;
        }
    }

    return result;
}

std::string inner_markup(const node_tree& tree, const node_id id)
{
    std::string result;

    if (tree.is_text(id))
    {
        return escape_markup(tree.text(id));
    }

    for (const node_id child : tree.children(id))
    {
        write_markup(result, tree, child);
    }

    return result;
}

std::string outer_markup(const node_tree& tree, const node_id id)
{
    std::string result;
    write_markup(result, tree, id);
    return result;
}

} // namespace prepress
