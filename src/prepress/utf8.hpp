#pragma once

#include <string>
#include <string_view>

namespace prepress {

// Lossless UTF-8 <-> UTF-32 conversion. Bytes that are not part of a valid
// sequence round-trip through the low surrogate range (U+DC80..U+DCFF).
[[nodiscard]] std::u32string decode_utf8(const std::string_view source);

[[nodiscard]] std::string encode_utf8(const std::u32string_view source);

void append_utf8(std::string& output, const char32_t cp);

} // namespace prepress
