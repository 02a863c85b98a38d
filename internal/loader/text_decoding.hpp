#pragma once

#include <string>
#include <string_view>

namespace docsync::loader {

// Drops every byte that is not part of a well-formed UTF-8 sequence
// (overlongs, surrogates and values above U+10FFFF included).
std::string SanitizeUtf8(std::string_view bytes);

// True when every code point is whitespace, Unicode spaces included.
// Malformed bytes count as content.
bool IsBlank(std::string_view text);

} // namespace docsync::loader
