#include "text/ansi_highlight.h"

#include "core/strings.h"
#include "core/utf8.h"

#include <algorithm>
#include <cstdint>

namespace ink::text
{
namespace
{
static constexpr std::uint8_t ESC = 27;

// Index of the unit starting exactly at text offset `off`, if any (the sentinel counts).
static std::optional<std::size_t> UnitAt(const PrintableText& p, std::size_t off)
{
    auto it = std::lower_bound(p.unit_offsets.begin(), p.unit_offsets.end(), off);
    if (it == p.unit_offsets.end() || *it != off)
        return std::nullopt;
    return (std::size_t)(it - p.unit_offsets.begin());
}
} // namespace

PrintableText ScanPrintable(std::string_view styled)
{
    PrintableText out;
    out.text.reserve(styled.size());
    out.unit_offsets.reserve(styled.size() + 1);
    out.source_offsets.reserve(styled.size() + 1);

    enum class State
    {
        Normal,
        Escape,
    };
    State state = State::Normal;

    std::size_t i = 0;
    while (i < styled.size())
    {
        const std::uint8_t b = (std::uint8_t)styled[i];
        if (state == State::Escape)
        {
            i += 1;
            if (b >= 0x40u && b <= 0x7Eu)
                state = State::Normal;
            continue;
        }

        if (b == ESC && i + 1 < styled.size() && styled[i + 1] == '[')
        {
            state = State::Escape;
            i += 2;
            continue;
        }

        const std::size_t start = i;
        char32_t cp = U'\0';
        if (!utf8::DecodeOne(styled.data(), styled.size(), i, cp))
            i = start + 1;

        out.unit_offsets.push_back(out.text.size());
        out.source_offsets.push_back(start);
        out.text.append(styled.substr(start, i - start));
    }

    out.unit_offsets.push_back(out.text.size());
    out.source_offsets.push_back(styled.size());
    return out;
}

std::vector<std::optional<ByteSpan>> LocateLabelSpans(std::string_view styled,
                                                       const std::vector<std::string>& labels)
{
    std::vector<std::optional<ByteSpan>> spans(labels.size());

    const PrintableText p = ScanPrintable(styled);
    if (p.text.empty())
        return spans;

    std::size_t search_from = 0;
    for (std::size_t li = 0; li < labels.size(); ++li)
    {
        const std::string_view label = TrimView(labels[li]);
        if (label.empty() || search_from >= p.text.size())
            continue;

        // The match must begin and end on unit boundaries; a hit inside a multi-byte unit is
        // skipped and the search resumes one byte further.
        std::size_t from = search_from;
        for (;;)
        {
            const std::size_t pos = p.text.find(label, from);
            if (pos == std::string::npos)
                break;

            const std::optional<std::size_t> first = UnitAt(p, pos);
            const std::optional<std::size_t> past = UnitAt(p, pos + label.size());
            if (!first || !past)
            {
                from = pos + 1;
                continue;
            }

            const std::size_t last = *past - 1;
            const std::size_t last_len = p.unit_offsets[last + 1] - p.unit_offsets[last];

            ByteSpan s;
            s.start = p.source_offsets[*first];
            s.end = p.source_offsets[last] + last_len;
            spans[li] = s;

            search_from = pos + label.size();
            break;
        }
    }
    return spans;
}

std::string HighlightFocusedLink(std::string_view rendered, const links::LinkRegistry& registry, int focused)
{
    if (focused < 0 || (std::size_t)focused >= registry.Size())
        return std::string(rendered);

    // Every link is located, not just the focused one: earlier links consume earlier
    // occurrences of a shared label.
    std::vector<std::string> labels;
    labels.reserve(registry.Size());
    for (const auto& l : registry.Links())
        labels.push_back(l.label);

    const std::vector<std::optional<ByteSpan>> spans = LocateLabelSpans(rendered, labels);
    const std::optional<ByteSpan>& s = spans[(std::size_t)focused];
    if (!s || s->end < s->start || s->end > rendered.size())
        return std::string(rendered);

    std::string out;
    out.reserve(rendered.size() + kReverseOn.size() + kReverseOff.size());
    out.append(rendered.substr(0, s->start));
    out.append(kReverseOn);
    out.append(rendered.substr(s->start, s->end - s->start));
    out.append(kReverseOff);
    out.append(rendered.substr(s->end));
    return out;
}
} // namespace ink::text
