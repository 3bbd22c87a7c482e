#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ink::links
{
// A link as written in the Markdown source, before any classification.
struct RawLink
{
    std::string href;  // destination, whitespace-trimmed, never empty
    std::string label; // concatenated text of the link content, whitespace-trimmed (may be empty)
};

// Parses `markdown` with md4c and returns every link span in document order.
//
// Inline, full/collapsed/shortcut reference links all arrive as the same md4c span. Images,
// autolinks (<https://...>) and bare paths are not link spans and never appear; neither do
// links nested inside an image description. Parsing is best-effort: whatever was collected
// before md4c gave up is returned.
std::vector<RawLink> ExtractRawLinks(std::string_view markdown);
} // namespace ink::links
