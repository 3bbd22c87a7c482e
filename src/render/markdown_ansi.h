#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Markdown -> ANSI text renderer.
//
// - md4c for parsing; its callbacks lay out styled lines as they stream in
// - fixed built-in styles emitted as SGR sequences
//
// The pager only consumes the resulting string; any renderer producing ANSI-styled text
// can take its place.
namespace ink::render
{
struct RenderOptions
{
    int width = 80;                 // wrap width in printable columns (clamped 20..400)
    bool show_line_numbers = false; // prefix lines with a dim 4-column number

    enum class LinkMode
    {
        TextOnly = 0,  // render only link label
        InlineUrl,     // render "label (url)"
    };
    LinkMode link_mode = LinkMode::TextOnly;

    // Horizontal rules.
    char32_t hr_glyph = U'─';

    // Safety limits.
    std::size_t max_input_bytes = 2u * 1024u * 1024u; // default 2 MiB
};

// Line number column width (without the separating space).
inline constexpr int kLineNumberWidth = 4;

bool RenderMarkdownToAnsi(std::string_view markdown_utf8,
                          const RenderOptions& opt,
                          std::string& out,
                          std::string& err);
} // namespace ink::render
