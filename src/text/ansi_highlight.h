#pragma once

#include "links/link_registry.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ink::text
{
// SGR reverse video on/off.
inline constexpr std::string_view kReverseOn = "\x1b[7m";
inline constexpr std::string_view kReverseOff = "\x1b[27m";

// Printable projection of ANSI-styled text.
//
// CSI sequences (ESC '[' ... final byte 0x40..0x7E) are removed. Every remaining character is one
// "unit": a decoded UTF-8 sequence, or a single raw byte when decoding fails. Unit bytes are copied
// verbatim, so a unit has the same byte length in `text` and in the source.
struct PrintableText
{
    std::string text;

    // Per unit: start offset in `text`; one trailing sentinel equal to text.size().
    std::vector<std::size_t> unit_offsets;

    // Per unit: start offset in the styled source; one trailing sentinel equal to source.size().
    std::vector<std::size_t> source_offsets;

    std::size_t UnitCount() const { return unit_offsets.empty() ? 0 : unit_offsets.size() - 1; }
};

PrintableText ScanPrintable(std::string_view styled);

// Byte range [start, end) in the styled source.
struct ByteSpan
{
    std::size_t start = 0;
    std::size_t end = 0;
};

// Finds each label (trimmed) in the printable text, in order, each search starting after the
// previous match so repeated labels map to successive occurrences. Entry i is empty when label i
// was not found. Spans cover the label's characters only, never a partial escape sequence or a
// partial UTF-8 character.
std::vector<std::optional<ByteSpan>> LocateLabelSpans(std::string_view styled,
                                                       const std::vector<std::string>& labels);

// Wraps the focused link's label in reverse video. Returns `rendered` unchanged when `focused` is
// out of range or its label cannot be located.
std::string HighlightFocusedLink(std::string_view rendered, const links::LinkRegistry& registry, int focused);
} // namespace ink::text
