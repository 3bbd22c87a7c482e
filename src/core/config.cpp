#include "core/config.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace ink
{
namespace
{
using json = nlohmann::json;
namespace fs = std::filesystem;

static constexpr int kSchemaVersion = 1;

static void EnsureParentDirExists(const std::string& path, std::string& err)
{
    err.clear();
    fs::path p(path);
    if (!p.has_parent_path())
        return;
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    if (ec)
        err = ec.message();
}

static void FromJson(const json& j, PagerConfig& out)
{
    if (auto it = j.find("root_dir"); it != j.end() && it->is_string())
        out.root_dir = it->get<std::string>();
    if (auto it = j.find("width"); it != j.end() && it->is_number_integer())
        out.width = it->get<int>();
    if (auto it = j.find("height"); it != j.end() && it->is_number_integer())
        out.height = it->get<int>();
    if (auto it = j.find("show_line_numbers"); it != j.end() && it->is_boolean())
        out.show_line_numbers = it->get<bool>();
    if (auto it = j.find("link_mode"); it != j.end() && it->is_string())
    {
        PagerConfig::LinkMode m = out.link_mode;
        if (LinkModeFromString(it->get<std::string>(), m))
            out.link_mode = m;
    }
    if (auto it = j.find("watch"); it != j.end() && it->is_boolean())
        out.watch = it->get<bool>();
    if (auto it = j.find("watch_interval_ms"); it != j.end() && it->is_number_integer())
        out.watch_interval_ms = it->get<int>();
    if (auto it = j.find("max_input_bytes"); it != j.end() && it->is_number_unsigned())
        out.max_input_bytes = it->get<std::size_t>();
    if (auto it = j.find("verbose"); it != j.end() && it->is_boolean())
        out.verbose = it->get<bool>();
}

static json ToJson(const PagerConfig& cfg)
{
    json j;
    j["schema_version"] = kSchemaVersion;
    j["root_dir"] = cfg.root_dir;
    j["width"] = cfg.width;
    j["height"] = cfg.height;
    j["show_line_numbers"] = cfg.show_line_numbers;
    j["link_mode"] = LinkModeToString(cfg.link_mode);
    j["watch"] = cfg.watch;
    j["watch_interval_ms"] = cfg.watch_interval_ms;
    j["max_input_bytes"] = cfg.max_input_bytes;
    j["verbose"] = cfg.verbose;
    return j;
}
} // namespace

void ClampConfig(PagerConfig& cfg)
{
    cfg.width = std::clamp(cfg.width, 20, 400);
    cfg.height = std::clamp(cfg.height, 3, 500);
    cfg.watch_interval_ms = std::clamp(cfg.watch_interval_ms, 20, 10000);
    if (cfg.max_input_bytes == 0)
        cfg.max_input_bytes = PagerConfig{}.max_input_bytes;
}

bool LoadConfig(const std::string& path, PagerConfig& out, std::string& err)
{
    err.clear();

    std::ifstream f(path);
    if (!f)
    {
        std::error_code ec;
        const bool exists = fs::exists(path, ec);
        if (exists && !ec)
        {
            err = std::string("Failed to open config file for reading: ") + path;
            return false;
        }
        return true; // first run: hardcoded defaults
    }

    json j;
    try
    {
        f >> j;
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse config (") + path + "): " + e.what();
        return false;
    }

    if (!j.is_object())
    {
        err = std::string("Config root must be an object: ") + path;
        return false;
    }

    // Basic schema check (but keep it forgiving).
    if (j.contains("schema_version") && j["schema_version"].is_number_integer())
    {
        if (j["schema_version"].get<int>() != kSchemaVersion)
            return true; // unknown schema: ignore file rather than failing startup
    }

    PagerConfig loaded = out;
    FromJson(j, loaded);
    ClampConfig(loaded);
    out = std::move(loaded);
    return true;
}

bool SaveConfig(const std::string& path, const PagerConfig& cfg, std::string& err)
{
    EnsureParentDirExists(path, err);
    if (!err.empty())
        return false;

    std::ofstream out(path);
    if (!out)
    {
        err = std::string("Failed to open config file for writing: ") + path;
        return false;
    }

    try
    {
        out << ToJson(cfg).dump(2) << "\n";
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to write config JSON: ") + e.what();
        return false;
    }
    return true;
}

const char* LinkModeToString(PagerConfig::LinkMode m)
{
    switch (m)
    {
        case PagerConfig::LinkMode::InlineUrl: return "inline_url";
        case PagerConfig::LinkMode::TextOnly:
        default: return "text";
    }
}

bool LinkModeFromString(const std::string& s, PagerConfig::LinkMode& out)
{
    if (s == "text")
    {
        out = PagerConfig::LinkMode::TextOnly;
        return true;
    }
    if (s == "inline_url")
    {
        out = PagerConfig::LinkMode::InlineUrl;
        return true;
    }
    return false;
}
} // namespace ink
