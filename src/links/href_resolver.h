#pragma once

#include "links/file_system.h"

#include <string>
#include <string_view>

namespace ink::links
{
// A link the pager can follow: a local Markdown file inside the root directory.
struct FollowableLink
{
    std::string href;          // destination after trim/angle-bracket stripping, before decoding
    std::string path;          // path portion (fragment removed), percent-decoded
    std::string fragment;      // text after the first '#', or empty
    std::string label;         // visible text, never empty once in a registry

    std::string resolved_path; // absolute, symlink-evaluated path of an existing regular file
    std::string resolved_note; // resolved_path relative to the evaluated root (status-line display)
};

enum class ResolveOutcome
{
    Followable = 0,
    NotFollowable, // silent rejection: external, absolute, wrong extension, missing, escapes root...
    Error,         // environment failure (absolute form cannot be computed); `err` is set
};

// ---------------------------------------------------------------------------
// Classification helpers
// ---------------------------------------------------------------------------

// Trims whitespace and strips one layer of "<...>" destination delimiters.
std::string NormalizeHref(std::string_view href);

// Splits at the first '#'. No '#' means an empty fragment.
void SplitFragment(std::string_view href, std::string& out_path, std::string& out_fragment);

// Leading '/', leading "\\", drive-letter prefix ("C:"), or absolute for the host platform.
bool IsAbsoluteOrUncPath(std::string_view path);

// True when `href` (normalized) names a relative .md/.markdown path: no "://" scheme separator,
// no mailto:, not absolute. Only the path portion's extension is considered.
bool IsFollowableHref(std::string_view href);

// Percent-decodes `in` ("%20" -> ' '). Returns false on a malformed escape ("%", "%4", "%zz").
bool PercentDecode(std::string_view in, std::string& out);

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

// Resolves `href` found in the document at `current_path` against `root_dir`.
//
// On Followable, every field of `out` except `label` is filled. The result always lies inside
// the symlink-evaluated root: both sides are symlink-evaluated before the containment test, so a
// symlink inside the root that points elsewhere is rejected.
ResolveOutcome ResolveFollowableLink(const FileSystem& fs,
                                     const std::string& root_dir,
                                     const std::string& current_path,
                                     std::string_view href,
                                     FollowableLink& out,
                                     std::string& err);
} // namespace ink::links
