#pragma once

#include <string>
#include <string_view>

namespace ink
{
// Trims ASCII whitespace (space, \t, \n, \v, \f, \r) from both ends.
std::string_view TrimView(std::string_view s);
std::string Trim(std::string_view s);

std::string ToLowerAscii(std::string s);

bool StartsWith(std::string_view s, std::string_view prefix);
bool EndsWith(std::string_view s, std::string_view suffix);

// Case-insensitive (ASCII) prefix/suffix tests.
bool StartsWithNoCase(std::string_view s, std::string_view prefix);
bool EndsWithNoCase(std::string_view s, std::string_view suffix);
} // namespace ink
