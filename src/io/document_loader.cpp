#include "io/document_loader.h"

#include "core/paths.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace ink::io
{
namespace fs = std::filesystem;

std::string EffectiveRootDir(const PagerConfig& cfg)
{
    if (!cfg.root_dir.empty())
        return cfg.root_dir;
    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (ec)
        return ".";
    return cwd.string();
}

bool LoadLocalDocument(const links::FileSystem& fsys,
                       const PagerConfig& cfg,
                       const std::string& path,
                       LoadedDocument& out,
                       std::string& err)
{
    err.clear();

    if (path.empty())
    {
        err = "No document path.";
        return false;
    }
    if (fsys.Stat(path) != links::FileKind::Regular)
    {
        err = std::string("Not a readable file: ") + path;
        return false;
    }

    std::error_code ec;
    const std::uintmax_t size = fs::file_size(path, ec);
    if (!ec && size > cfg.max_input_bytes)
    {
        err = std::string("Document too large (") + std::to_string(size) + " bytes): " + path;
        return false;
    }

    std::ifstream f(path, std::ios::binary);
    if (!f)
    {
        err = std::string("Failed to open document: ") + path;
        return false;
    }
    std::string body((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad())
    {
        err = std::string("Failed to read document: ") + path;
        return false;
    }

    const std::string root = EffectiveRootDir(cfg);

    links::LinkRegistry registry;
    std::string lerr;
    if (!links::BuildLinkRegistry(fsys, root, path, body, registry, lerr))
    {
        err = std::string("Failed to resolve links in ") + path + ": " + lerr;
        return false;
    }

    std::string root_abs = root;
    std::string abs_err;
    if (fsys.Absolute(root, root_abs, abs_err))
    {
        if (std::string eval; fsys.EvalSymlinks(root_abs, eval))
            root_abs = std::move(eval);
    }
    std::string doc_abs = path;
    if (fsys.Absolute(path, doc_abs, abs_err))
    {
        if (std::string eval; fsys.EvalSymlinks(doc_abs, eval))
            doc_abs = std::move(eval);
    }

    out = LoadedDocument{};
    out.local_path = path;
    out.note = StripRootPrefix(doc_abs, root_abs);
    out.body = std::move(body);
    out.links = std::move(registry);
    return true;
}
} // namespace ink::io
