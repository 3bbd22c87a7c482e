#pragma once

#include <string>
#include <string_view>

namespace ink
{
// Decodes one HTML entity as reported by md4c for MD_TEXT_ENTITY runs ("&amp;", "&#42;", "&#x2A;").
// Numeric references and a small set of common named entities are decoded; anything else is
// returned verbatim.
std::string DecodeHtmlEntity(std::string_view entity);
} // namespace ink
