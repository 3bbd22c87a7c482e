#pragma once

#include <string>

namespace ink::links
{
enum class FileKind
{
    Missing = 0, // cannot be stat'd (absent, dangling symlink, permission error)
    Regular,
    Directory,
    Other,
};

// Filesystem queries needed by link resolution.
//
// Resolution is written only against this interface so it can run against an in-memory fake
// in unit tests and against the real filesystem everywhere else.
class FileSystem
{
public:
    virtual ~FileSystem() = default;

    // Absolute, lexically cleaned form of `path` (no "." / ".." segments, no trailing separator).
    // Returns false with `err` set only when the absolute form cannot be computed at all.
    virtual bool Absolute(const std::string& path, std::string& out, std::string& err) const = 0;

    // Resolves every symlink in `path`. Returns false when that is not possible (typically because
    // some component does not exist); callers then keep the unevaluated form.
    virtual bool EvalSymlinks(const std::string& path, std::string& out) const = 0;

    // Follows symlinks.
    virtual FileKind Stat(const std::string& path) const = 0;
};

// std::filesystem backed implementation.
class RealFileSystem final : public FileSystem
{
public:
    bool Absolute(const std::string& path, std::string& out, std::string& err) const override;
    bool EvalSymlinks(const std::string& path, std::string& out) const override;
    FileKind Stat(const std::string& path) const override;
};

// Lexical cleanup shared by implementations: collapses "." / ".." and drops a trailing separator.
std::string CleanPath(const std::string& path);

// Directory part of `path` ("." when there is none).
std::string DirOf(const std::string& path);
} // namespace ink::links
