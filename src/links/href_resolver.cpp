#include "links/href_resolver.h"

#include "core/paths.h"
#include "core/strings.h"

#include <filesystem>
#include <utility>

namespace ink::links
{
namespace
{
namespace fs = std::filesystem;

static int HexValue(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

// `candidate` relative to `root` stays inside it ("." or a path not starting with "..").
static bool IsInsideRoot(const std::string& root, const std::string& candidate)
{
    const fs::path rel = fs::path(candidate).lexically_relative(fs::path(root));
    if (rel.empty())
        return false; // no relative form (different root names)
    return *rel.begin() != "..";
}

// `h` is already normalized; normalizing again would strip a second layer of "<>".
static bool IsFollowableNormalized(const std::string& h)
{
    if (h.find("://") != std::string::npos || StartsWithNoCase(h, "mailto:"))
        return false;

    std::string path;
    std::string fragment;
    SplitFragment(h, path, fragment);
    if (IsAbsoluteOrUncPath(path))
        return false;

    return EndsWithNoCase(path, ".md") || EndsWithNoCase(path, ".markdown");
}
} // namespace

std::string NormalizeHref(std::string_view href)
{
    std::string_view s = TrimView(href);
    if (s.size() >= 2 && s.front() == '<' && s.back() == '>')
        s = s.substr(1, s.size() - 2);
    return std::string(s);
}

void SplitFragment(std::string_view href, std::string& out_path, std::string& out_fragment)
{
    const size_t hash = href.find('#');
    if (hash == std::string_view::npos)
    {
        out_path.assign(href.begin(), href.end());
        out_fragment.clear();
        return;
    }
    out_path.assign(href.substr(0, hash));
    out_fragment.assign(href.substr(hash + 1));
}

bool IsAbsoluteOrUncPath(std::string_view path)
{
    if (StartsWith(path, "/"))
        return true;
    if (StartsWith(path, "\\\\"))
        return true;
    if (path.size() >= 2)
    {
        const char c0 = path[0];
        if (((c0 >= 'a' && c0 <= 'z') || (c0 >= 'A' && c0 <= 'Z')) && path[1] == ':')
            return true;
    }
    return fs::path(std::string(path)).is_absolute();
}

bool IsFollowableHref(std::string_view href)
{
    return IsFollowableNormalized(NormalizeHref(href));
}

bool PercentDecode(std::string_view in, std::string& out)
{
    std::string decoded;
    decoded.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i)
    {
        if (in[i] != '%')
        {
            decoded.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size())
            return false;
        const int hi = HexValue(in[i + 1]);
        const int lo = HexValue(in[i + 2]);
        if (hi < 0 || lo < 0)
            return false;
        decoded.push_back((char)((hi << 4) | lo));
        i += 2;
    }
    out = std::move(decoded);
    return true;
}

ResolveOutcome ResolveFollowableLink(const FileSystem& fs,
                                     const std::string& root_dir,
                                     const std::string& current_path,
                                     std::string_view href,
                                     FollowableLink& out,
                                     std::string& err)
{
    err.clear();

    const std::string normalized = NormalizeHref(href);
    if (!IsFollowableNormalized(normalized))
        return ResolveOutcome::NotFollowable;

    std::string path;
    std::string fragment;
    SplitFragment(normalized, path, fragment);
    path = Trim(path);
    if (path.empty())
        return ResolveOutcome::NotFollowable;

    if (path.find('%') != std::string::npos)
    {
        // Best effort: a malformed escape keeps the raw path.
        std::string decoded;
        if (PercentDecode(path, decoded))
            path = std::move(decoded);
    }

    // Plain concatenation: a decoded leading '/' must not replace the base directory.
    const std::string candidate = CleanPath(DirOf(current_path) + "/" + path);

    std::string root_abs;
    if (!fs.Absolute(root_dir, root_abs, err))
    {
        err = "abs root dir: " + err;
        return ResolveOutcome::Error;
    }
    std::string res_abs;
    if (!fs.Absolute(candidate, res_abs, err))
    {
        err = "abs resolved path: " + err;
        return ResolveOutcome::Error;
    }

    // Missing files cannot be evaluated; they keep their absolute form and fail the stat below.
    if (std::string eval; fs.EvalSymlinks(root_abs, eval))
        root_abs = std::move(eval);
    if (std::string eval; fs.EvalSymlinks(res_abs, eval))
        res_abs = std::move(eval);

    if (!IsInsideRoot(root_abs, res_abs))
        return ResolveOutcome::NotFollowable;

    if (fs.Stat(res_abs) != FileKind::Regular)
        return ResolveOutcome::NotFollowable;

    out = FollowableLink{};
    out.href = normalized;
    out.path = std::move(path);
    out.fragment = std::move(fragment);
    out.resolved_note = StripRootPrefix(res_abs, root_abs);
    out.resolved_path = std::move(res_abs);
    return ResolveOutcome::Followable;
}
} // namespace ink::links
