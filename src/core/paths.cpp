#include "core/paths.h"

#include <cstdlib>
#include <filesystem>

namespace ink
{
namespace fs = std::filesystem;

static std::string EnvOrEmpty(const char* name)
{
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

std::string GetInkConfigDir()
{
    const std::string xdg = EnvOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return xdg + "/inkpager";

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return home + "/.config/inkpager";

    // Last resort: current directory
    return ".";
}

std::string GetDefaultConfigPath()
{
    return (fs::path(GetInkConfigDir()) / "config.json").string();
}

std::string StripRootPrefix(const std::string& full_path, const std::string& root)
{
    if (root.empty())
        return full_path;

    std::string prefix = root;
    if (prefix.back() != fs::path::preferred_separator)
        prefix.push_back((char)fs::path::preferred_separator);

    if (full_path.size() > prefix.size() && full_path.compare(0, prefix.size(), prefix) == 0)
        return full_path.substr(prefix.size());
    return full_path;
}
} // namespace ink
