#include "utf8.hpp"

#include <string>
#include <string_view>

#include <cstddef>

namespace prepress {

namespace {

constexpr char32_t raw_byte_base = 0xDC00;

[[nodiscard]] std::size_t sequence_length(const unsigned char lead) noexcept
{
    if (lead < 0x80)
    {
        return 1;
    }

    if ((lead & 0xE0) == 0xC0)
    {
        return 2;
    }

    if ((lead & 0xF0) == 0xE0)
    {
        return 3;
    }

    if ((lead & 0xF8) == 0xF0)
    {
        return 4;
    }

    return 0;
}

} // namespace

std::u32string decode_utf8(const std::string_view source)
{
    std::u32string result;
    result.reserve(source.size());

    std::size_t i = 0;
    while (i < source.size())
    {
        const auto lead = static_cast<unsigned char>(source[i]);
        const std::size_t len = sequence_length(lead);

        bool valid = len != 0 && i + len <= source.size();
        for (std::size_t j = 1; valid && j < len; ++j)
        {
            valid = (static_cast<unsigned char>(source[i + j]) & 0xC0) == 0x80;
        }

        if (!valid)
        {
            result.push_back(raw_byte_base + lead);
            ++i;
            continue;
        }

        char32_t cp = len == 1 ? lead : lead & (0xFF >> (len + 1));
        for (std::size_t j = 1; j < len; ++j)
        {
            cp = (cp << 6) | (static_cast<unsigned char>(source[i + j]) & 0x3F);
        }

        result.push_back(cp);
        i += len;
    }

    return result;
}

void append_utf8(std::string& output, const char32_t cp)
{
    if (cp >= raw_byte_base + 0x80 && cp <= raw_byte_base + 0xFF)
    {
        output.push_back(static_cast<char>(cp - raw_byte_base));
        return;
    }

    if (cp < 0x80)
    {
        output.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        output.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        output.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        output.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        output.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        output.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        output.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string encode_utf8(const std::u32string_view source)
{
    std::string result;
    result.reserve(source.size());

    for (const char32_t cp : source)
    {
        append_utf8(result, cp);
    }

    return result;
}

} // namespace prepress
