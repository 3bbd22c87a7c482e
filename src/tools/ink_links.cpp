#include "core/config.h"
#include "io/document_loader.h"
#include "links/file_system.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace
{
static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [--root <dir>] <file.md>\n"
              << "\n"
              << "Prints the followable links of a Markdown document as JSON: local .md/.markdown\n"
              << "targets that exist and stay inside the root directory.\n"
              << "\n"
              << "Options:\n"
              << "  --root <dir>  Sandbox root (default: current directory)\n";
}
} // namespace

int main(int argc, char** argv)
{
    ink::PagerConfig cfg;
    std::string doc_path;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        if (a == "--root")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for --root\n";
                PrintUsage(argv[0]);
                return 2;
            }
            cfg.root_dir = argv[++i];
            continue;
        }
        if (!a.empty() && a[0] == '-')
        {
            std::cerr << "Unknown option: " << a << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
        if (!doc_path.empty())
        {
            std::cerr << "Only one document may be given\n";
            return 2;
        }
        doc_path = std::string(a);
    }

    if (doc_path.empty())
    {
        PrintUsage(argv[0]);
        return 2;
    }

    ink::links::RealFileSystem fs;
    ink::io::LoadedDocument doc;
    std::string err;
    if (!ink::io::LoadLocalDocument(fs, cfg, doc_path, doc, err))
    {
        std::cerr << "[load] " << err << "\n";
        return 3;
    }

    nlohmann::json links = nlohmann::json::array();
    for (const ink::links::FollowableLink& l : doc.links.Links())
    {
        nlohmann::json item;
        item["href"] = l.href;
        item["path"] = l.path;
        item["fragment"] = l.fragment;
        item["label"] = l.label;
        item["resolved_path"] = l.resolved_path;
        item["resolved_note"] = l.resolved_note;
        links.push_back(std::move(item));
    }

    nlohmann::json out;
    out["document"] = doc.local_path;
    out["root"] = ink::io::EffectiveRootDir(cfg);
    out["links"] = std::move(links);
    std::cout << out.dump(2) << "\n";
    return 0;
}
