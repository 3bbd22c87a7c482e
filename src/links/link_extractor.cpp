#include "links/link_extractor.h"

#include "core/entities.h"
#include "core/md_text.h"
#include "core/strings.h"

#include <md4c.h>

#include <cstdio>
#include <cstring>
#include <optional>

namespace ink::links
{
namespace
{
// Flattens an md4c attribute (href) into a plain string, decoding entity substrings.
static std::string AttributeToString(const MD_ATTRIBUTE& attr)
{
    std::string out;
    if (!attr.text || attr.size == 0)
        return out;
    if (!attr.substr_offsets || !attr.substr_types)
        return std::string(attr.text, attr.size);

    for (int k = 0; attr.substr_offsets[k] < attr.size; ++k)
    {
        const MD_OFFSET off = attr.substr_offsets[k];
        const MD_SIZE len = attr.substr_offsets[k + 1] - off;
        const std::string_view part(attr.text + off, len);
        switch (attr.substr_types[k])
        {
            case MD_TEXT_ENTITY:
                out += DecodeHtmlEntity(part);
                break;
            case MD_TEXT_NULLCHAR:
                out += "\xEF\xBF\xBD";
                break;
            default:
                out.append(part.begin(), part.end());
                break;
        }
    }
    return out;
}

struct Collector
{
    std::vector<RawLink> links;

    // One entry per open MD_SPAN_A; nullopt marks a span whose content is not collected
    // (autolinks, links inside image descriptions).
    std::vector<std::optional<RawLink>> open;
    int image_depth = 0;

    RawLink* Active()
    {
        if (open.empty() || !open.back())
            return nullptr;
        return &*open.back();
    }
};

static int EnterBlockCb(MD_BLOCKTYPE, void*, void*)
{
    return 0;
}

static int LeaveBlockCb(MD_BLOCKTYPE, void*, void*)
{
    return 0;
}

static int EnterSpanCb(MD_SPANTYPE type, void* detail, void* userdata)
{
    Collector& c = *(Collector*)userdata;
    switch (type)
    {
        case MD_SPAN_A:
        {
            auto* ad = (MD_SPAN_A_DETAIL*)detail;
            if (!ad || ad->is_autolink || c.image_depth > 0)
            {
                c.open.emplace_back(std::nullopt);
                return 0;
            }
            RawLink l;
            l.href = AttributeToString(ad->href);
            c.open.emplace_back(std::move(l));
            return 0;
        }
        case MD_SPAN_IMG:
            c.image_depth++;
            return 0;
        default:
            return 0;
    }
}

static int LeaveSpanCb(MD_SPANTYPE type, void*, void* userdata)
{
    Collector& c = *(Collector*)userdata;
    switch (type)
    {
        case MD_SPAN_A:
        {
            if (c.open.empty())
                return 0;
            std::optional<RawLink> l = std::move(c.open.back());
            c.open.pop_back();
            if (!l)
                return 0;

            l->href = Trim(l->href);
            if (l->href.empty())
                return 0;
            l->label = Trim(l->label);
            c.links.push_back(std::move(*l));
            return 0;
        }
        case MD_SPAN_IMG:
            if (c.image_depth > 0)
                c.image_depth--;
            return 0;
        default:
            return 0;
    }
}

static int TextCb(MD_TEXTTYPE type, const MD_CHAR* text, MD_SIZE size, void* userdata)
{
    Collector& c = *(Collector*)userdata;
    RawLink* l = c.Active();
    if (!l)
        return 0;

    // Raw HTML and LaTeX runs contribute no visible label text.
    AppendVisibleText(type, std::string_view(text ? text : "", (size_t)size), l->label);
    return 0;
}
} // namespace

std::vector<RawLink> ExtractRawLinks(std::string_view markdown)
{
    Collector c;

    MD_PARSER parser;
    std::memset(&parser, 0, sizeof(parser));
    parser.abi_version = 0;
    parser.flags =
        MD_FLAG_TABLES |
        MD_FLAG_STRIKETHROUGH |
        MD_FLAG_TASKLISTS;
    parser.enter_block = EnterBlockCb;
    parser.leave_block = LeaveBlockCb;
    parser.enter_span = EnterSpanCb;
    parser.leave_span = LeaveSpanCb;
    parser.text = TextCb;

    // A non-zero return only means md4c stopped early; keep what it produced.
    if (md_parse(markdown.data(), (MD_SIZE)markdown.size(), &parser, &c) != 0)
        std::fprintf(stderr, "[links] markdown parse stopped early (%zu link(s) collected)\n", c.links.size());
    return std::move(c.links);
}
} // namespace ink::links
