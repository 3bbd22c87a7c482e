#include "core/utf8.h"

#include <cstdint>

namespace ink::utf8
{
bool DecodeOne(const char* data, size_t len, size_t& i, char32_t& out_cp)
{
    out_cp = U'\0';
    if (i >= len)
        return false;

    const std::uint8_t c = (std::uint8_t)data[i];
    if ((c & 0x80u) == 0)
    {
        out_cp = (char32_t)c;
        i += 1;
        return true;
    }

    size_t remaining = 0;
    char32_t cp = 0;
    char32_t min_cp = 0;
    if ((c & 0xE0u) == 0xC0u) { cp = c & 0x1Fu; remaining = 1; min_cp = 0x80; }
    else if ((c & 0xF0u) == 0xE0u) { cp = c & 0x0Fu; remaining = 2; min_cp = 0x800; }
    else if ((c & 0xF8u) == 0xF0u) { cp = c & 0x07u; remaining = 3; min_cp = 0x10000; }
    else
    {
        i += 1;
        return false;
    }

    if (i + remaining >= len)
    {
        i += 1;
        return false;
    }

    for (size_t j = 0; j < remaining; ++j)
    {
        const std::uint8_t cc = (std::uint8_t)data[i + 1 + j];
        if ((cc & 0xC0u) != 0x80u)
        {
            i += 1;
            return false;
        }
        cp = (cp << 6) | (cc & 0x3Fu);
    }

    // Overlong forms, surrogates and out-of-range values are not valid characters.
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
    {
        i += 1;
        return false;
    }

    i += 1 + remaining;
    out_cp = cp;
    return true;
}

size_t CountUnits(std::string_view s)
{
    size_t n = 0;
    size_t i = 0;
    while (i < s.size())
    {
        char32_t cp = U'\0';
        const size_t before = i;
        if (!DecodeOne(s.data(), s.size(), i, cp))
            i = before + 1;
        ++n;
    }
    return n;
}

void AppendCodepoint(std::string& out, char32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back((char)cp);
    }
    else if (cp < 0x800)
    {
        out.push_back((char)(0xC0 | (cp >> 6)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back((char)(0xE0 | (cp >> 12)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back((char)(0xF0 | (cp >> 18)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}
} // namespace ink::utf8
