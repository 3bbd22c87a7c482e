#pragma once

#include <md4c.h>

#include <string>
#include <string_view>

namespace ink
{
// What one md4c text run shows on screen, shared by the renderer and the link label extractor
// so a label always matches the rendered text.
//
// Entities are decoded, NUL becomes U+FFFD, soft and hard breaks read as one space, and HTML or
// LaTeX runs show nothing. Control characters are dropped (see StripControls).
void AppendVisibleText(MD_TEXTTYPE type, std::string_view raw, std::string& out);

// Drops C0 controls other than \n and \t, and DEL, so source text cannot start an escape sequence.
std::string StripControls(std::string_view s);
} // namespace ink
