#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace ink::utf8
{
// Decodes one UTF-8 sequence starting at `i`.
// On success advances `i` past the sequence and returns true.
// On failure (invalid lead byte, truncated or malformed continuation) advances `i` by
// at least one byte and returns false; callers treat the skipped byte as one raw unit.
bool DecodeOne(const char* data, size_t len, size_t& i, char32_t& out_cp);

// Number of decoded units in `s`, counting each undecodable byte as one unit.
size_t CountUnits(std::string_view s);

void AppendCodepoint(std::string& out, char32_t cp);
} // namespace ink::utf8
