#pragma once

#include <cstddef>
#include <string>

namespace ink
{
// Pager configuration (config.json, schema_version=1).
//
// Every field has a usable default, so a missing file is not an error. CLI flags are applied
// on top of whatever was loaded.
struct PagerConfig
{
    // Sandbox boundary for followable links. Empty means "current working directory".
    std::string root_dir;

    // Viewport geometry.
    int width = 80;   // wrap width (clamped 20..400)
    int height = 24;  // visible lines (clamped 3..500)

    bool show_line_numbers = false;

    enum class LinkMode
    {
        TextOnly = 0,  // render only link label
        InlineUrl,     // render "label (url)"
    };
    LinkMode link_mode = LinkMode::TextOnly;

    // Directory change watching.
    bool watch = true;
    int watch_interval_ms = 250; // clamped 20..10000

    std::size_t max_input_bytes = 2u * 1024u * 1024u; // default 2 MiB

    bool verbose = false;
};

// Clamps numeric fields into their supported ranges.
void ClampConfig(PagerConfig& cfg);

// Loads `path` into `out`.
// - missing file: returns true, `out` untouched (defaults)
// - unreadable/malformed file: returns false with `err` set, `out` untouched
// - unknown schema_version: returns true, `out` untouched
bool LoadConfig(const std::string& path, PagerConfig& out, std::string& err);

bool SaveConfig(const std::string& path, const PagerConfig& cfg, std::string& err);

const char* LinkModeToString(PagerConfig::LinkMode m);
bool LinkModeFromString(const std::string& s, PagerConfig::LinkMode& out);
} // namespace ink
