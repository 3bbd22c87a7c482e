#include "links/file_system.h"

#include <filesystem>
#include <system_error>

namespace ink::links
{
namespace fs = std::filesystem;

std::string CleanPath(const std::string& path)
{
    if (path.empty())
        return ".";

    fs::path p = fs::path(path).lexically_normal();
    // "a/b/" normalizes to "a/b/" (empty trailing filename); drop it so relative
    // computations compare whole components only.
    if (!p.has_filename() && p.has_relative_path())
        p = p.parent_path();

    std::string out = p.string();
    return out.empty() ? std::string(".") : out;
}

std::string DirOf(const std::string& path)
{
    const fs::path parent = fs::path(path).parent_path();
    if (parent.empty())
        return ".";
    return parent.string();
}

bool RealFileSystem::Absolute(const std::string& path, std::string& out, std::string& err) const
{
    err.clear();
    std::error_code ec;
    const fs::path abs = fs::absolute(fs::path(path), ec);
    if (ec)
    {
        err = std::string("abs ") + path + ": " + ec.message();
        return false;
    }
    out = CleanPath(abs.string());
    return true;
}

bool RealFileSystem::EvalSymlinks(const std::string& path, std::string& out) const
{
    std::error_code ec;
    const fs::path real = fs::canonical(fs::path(path), ec);
    if (ec)
        return false;
    out = real.string();
    return true;
}

FileKind RealFileSystem::Stat(const std::string& path) const
{
    std::error_code ec;
    const fs::file_status st = fs::status(fs::path(path), ec);
    if (ec || !fs::exists(st))
        return FileKind::Missing;
    if (fs::is_regular_file(st))
        return FileKind::Regular;
    if (fs::is_directory(st))
        return FileKind::Directory;
    return FileKind::Other;
}
} // namespace ink::links
