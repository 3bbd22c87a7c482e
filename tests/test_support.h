#pragma once

#include "links/file_system.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <system_error>

namespace ink::test
{
// Unique directory under the system temp dir, removed (recursively) on destruction.
class TempDir
{
public:
    TempDir()
    {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("ink_tests_" + std::to_string((long long)stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }
    std::string Str(const std::string& rel = {}) const { return rel.empty() ? path_.string() : (path_ / rel).string(); }

private:
    std::filesystem::path path_;
};

inline void MakeDirs(const std::filesystem::path& p)
{
    std::filesystem::create_directories(p);
}

inline void WriteFile(const std::filesystem::path& p, const std::string& contents)
{
    if (p.has_parent_path())
        std::filesystem::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << contents;
}

// Absolute form with symlinks evaluated when possible.
inline std::string AbsEvalSymlinks(const std::filesystem::path& p)
{
    std::error_code ec;
    const std::filesystem::path abs = std::filesystem::absolute(p, ec);
    const std::filesystem::path eval = std::filesystem::canonical(abs, ec);
    return ec ? abs.lexically_normal().string() : eval.string();
}

// In-memory filesystem. Paths are POSIX-style and absolute; symlinks map a path to an absolute
// target and may appear at any component.
class FakeFileSystem final : public links::FileSystem
{
public:
    std::string cwd = "/work";
    std::map<std::string, links::FileKind> entries;
    std::map<std::string, std::string> symlinks;
    std::set<std::string> absolute_failures;

    void AddDir(const std::string& p)
    {
        std::filesystem::path cur;
        for (const auto& part : std::filesystem::path(p))
        {
            cur /= part;
            if (cur.string() != "/")
                entries.emplace(cur.string(), links::FileKind::Directory);
        }
    }

    void AddFile(const std::string& p)
    {
        AddDir(std::filesystem::path(p).parent_path().string());
        entries[p] = links::FileKind::Regular;
    }

    void AddSymlink(const std::string& link, const std::string& target)
    {
        AddDir(std::filesystem::path(link).parent_path().string());
        symlinks[link] = target;
    }

    bool Absolute(const std::string& path, std::string& out, std::string& err) const override
    {
        err.clear();
        if (absolute_failures.count(path))
        {
            err = "getwd: no such file or directory";
            return false;
        }
        out = links::CleanPath(!path.empty() && path[0] == '/' ? path : cwd + "/" + path);
        return true;
    }

    bool EvalSymlinks(const std::string& path, std::string& out) const override
    {
        return Resolve(path, out);
    }

    links::FileKind Stat(const std::string& path) const override
    {
        std::string real;
        if (!Resolve(path, real))
            return links::FileKind::Missing;
        auto it = entries.find(real);
        return it == entries.end() ? links::FileKind::Missing : it->second;
    }

private:
    // Every component must exist; symlinked components are replaced by their target.
    bool Resolve(const std::string& path, std::string& out) const
    {
        std::string cur;
        for (const auto& part : std::filesystem::path(links::CleanPath(path)))
        {
            const std::string s = part.string();
            if (s == "/" || s.empty())
                continue;
            cur += "/" + s;
            auto link = symlinks.find(cur);
            if (link != symlinks.end())
                cur = links::CleanPath(link->second);
            if (!entries.count(cur))
                return false;
        }
        out = cur.empty() ? "/" : cur;
        return true;
    }
};
} // namespace ink::test
