#pragma once

#include "core/config.h"
#include "links/file_system.h"
#include "links/link_registry.h"

#include <string>

namespace ink::io
{
// A local Markdown document ready for rendering, with its followable links.
struct LoadedDocument
{
    std::string local_path; // as requested (absolute when it came from a link or history)
    std::string note;       // short display name (root-relative when inside the root)
    std::string body;       // Markdown source
    links::LinkRegistry links;
};

// Reads `path` (up to cfg.max_input_bytes) and builds its link registry against cfg.root_dir
// (current directory when empty).
bool LoadLocalDocument(const links::FileSystem& fs,
                       const PagerConfig& cfg,
                       const std::string& path,
                       LoadedDocument& out,
                       std::string& err);

// Root directory actually used for `cfg` (cfg.root_dir, or the current directory).
std::string EffectiveRootDir(const PagerConfig& cfg);
} // namespace ink::io
