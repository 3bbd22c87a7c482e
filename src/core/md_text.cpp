#include "core/md_text.h"

#include "core/entities.h"

namespace ink
{
std::string StripControls(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (unsigned char ch : s)
    {
        if ((ch < 0x20 && ch != '\n' && ch != '\t') || ch == 0x7F)
            continue;
        out.push_back((char)ch);
    }
    return out;
}

void AppendVisibleText(MD_TEXTTYPE type, std::string_view raw, std::string& out)
{
    switch (type)
    {
        case MD_TEXT_NORMAL:
        case MD_TEXT_CODE:
            out += StripControls(raw);
            break;
        case MD_TEXT_ENTITY:
            out += StripControls(DecodeHtmlEntity(raw));
            break;
        case MD_TEXT_NULLCHAR:
            out += "\xEF\xBF\xBD";
            break;
        case MD_TEXT_SOFTBR:
        case MD_TEXT_BR:
            out.push_back(' ');
            break;
        default:
            break;
    }
}
} // namespace ink
