#include "core/entities.h"

#include "core/utf8.h"

#include <cstdlib>

namespace ink
{
namespace
{
struct NamedEntity
{
    std::string_view name;
    char32_t cp;
};

static constexpr NamedEntity kNamed[] = {
    {"amp", U'&'},    {"lt", U'<'},      {"gt", U'>'},     {"quot", U'"'},
    {"apos", U'\''},  {"nbsp", U'\u00A0'}, {"copy", U'©'}, {"reg", U'®'},
    {"trade", U'™'}, {"hellip", U'…'}, {"mdash", U'—'}, {"ndash", U'–'},
    {"laquo", U'«'}, {"raquo", U'»'}, {"larr", U'←'}, {"rarr", U'→'},
};
} // namespace

std::string DecodeHtmlEntity(std::string_view entity)
{
    if (entity.size() < 3 || entity.front() != '&' || entity.back() != ';')
        return std::string(entity);

    const std::string_view body = entity.substr(1, entity.size() - 2);
    if (body.empty())
        return std::string(entity);

    if (body[0] == '#')
    {
        const bool hex = body.size() > 1 && (body[1] == 'x' || body[1] == 'X');
        const std::string digits(body.substr(hex ? 2 : 1));
        if (digits.empty())
            return std::string(entity);
        char* end = nullptr;
        const unsigned long v = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
        if (!end || *end != '\0')
            return std::string(entity);
        char32_t cp = (char32_t)v;
        // CommonMark: invalid code points and U+0000 become U+FFFD.
        if (v == 0 || v > 0x10FFFF || (v >= 0xD800 && v <= 0xDFFF))
            cp = U'\uFFFD';
        std::string out;
        utf8::AppendCodepoint(out, cp);
        return out;
    }

    for (const auto& e : kNamed)
    {
        if (e.name == body)
        {
            std::string out;
            utf8::AppendCodepoint(out, e.cp);
            return out;
        }
    }
    return std::string(entity);
}
} // namespace ink
