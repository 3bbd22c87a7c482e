#include "app/app_events.h"
#include "app/worker.h"

#include "core/config.h"
#include "core/paths.h"
#include "core/strings.h"

#include "io/dir_watcher.h"
#include "io/document_loader.h"

#include "links/file_system.h"

#include "pager/pager.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>

namespace
{
static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [options] <file.md>\n"
              << "\n"
              << "Pages a Markdown document and follows its local links. Commands are read from\n"
              << "stdin, one per line: n/tab, p/shift-tab, f/enter (an empty line), b/backspace,\n"
              << "j, k, d, u, space, pgup, g, G, r, esc, q.\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>   Config file (default: " << ink::GetDefaultConfigPath() << ")\n"
              << "  --root <dir>      Links may not leave this directory (default: current dir)\n"
              << "  --width <n>       Wrap width\n"
              << "  --height <n>      Visible lines\n"
              << "  --line-numbers    Prefix lines with line numbers\n"
              << "  --no-watch        Do not reload when the file changes on disk\n"
              << "  --verbose         Log informational messages to stderr\n"
              << "  --write-config    Save the effective settings to the config file and exit\n"
              << "  --help            Show this help\n";
}

static bool ParseInt(std::string_view s, int& out)
{
    if (s.empty())
        return false;
    const std::string tmp(s);
    char* end = nullptr;
    const long v = std::strtol(tmp.c_str(), &end, 10);
    if (end == tmp.c_str() || *end != '\0')
        return false;
    out = (int)v;
    return true;
}

// Maps one stdin line to a pager key name.
static std::string LineToKey(const std::string& line)
{
    const std::string key = ink::Trim(line);
    if (key.empty())
        return "enter";
    if (key.size() == 1)
        return key;
    return ink::ToLowerAscii(key);
}

class AppHost final : public ink::pager::PagerHost
{
public:
    AppHost(ink::app::Worker& worker, ink::app::EventQueue& events, const ink::PagerConfig& cfg)
        : worker_(worker)
        , events_(events)
        , watcher_(std::chrono::milliseconds(cfg.watch_interval_ms))
        , verbose_(cfg.verbose)
    {
    }

    void RequestLoad(const std::string& path, const std::string& note) override
    {
        worker_.EnqueueLoad(path, note);
    }

    void RequestRender(const std::string& markdown, int width) override
    {
        worker_.EnqueueRender(markdown, width);
    }

    void WatchDirectory(const std::string& dir) override
    {
        const std::uint64_t gen = ++watch_gen_;
        ink::app::EventQueue* events = &events_;
        std::string err;
        if (!watcher_.Start(
                dir,
                [events, gen](const ink::io::ChangeEvent& ev) { events->Push(ink::app::FileChangedEvent{gen, ev}); },
                err))
        {
            std::fprintf(stderr, "[watch] %s\n", err.c_str());
            return;
        }
        if (verbose_)
            std::fprintf(stderr, "[watch] watching %s\n", dir.c_str());
    }

    void StopWatching() override
    {
        if (!watcher_.IsWatching())
            return;
        const std::string dir = watcher_.WatchedDir();
        watcher_.Stop();
        ++watch_gen_;
        if (verbose_)
            std::fprintf(stderr, "[watch] stopped watching %s\n", dir.c_str());
    }

    bool IsCurrentWatch(std::uint64_t gen) const { return gen == watch_gen_; }

private:
    ink::app::Worker& worker_;
    ink::app::EventQueue& events_;
    ink::io::DirWatcher watcher_;
    std::uint64_t watch_gen_ = 0;
    bool verbose_ = false;
};

static void PrintView(const ink::pager::Pager& pager)
{
    const std::string view = pager.View();
    std::fwrite(view.data(), 1, view.size(), stdout);
    std::fputs("\n\n", stdout);
    std::fflush(stdout);
}
} // namespace

int main(int argc, char** argv)
{
    std::optional<std::string> config_path;
    std::optional<std::string> root_dir;
    std::optional<int> width;
    std::optional<int> height;
    bool line_numbers = false;
    bool no_watch = false;
    bool verbose = false;
    bool write_config = false;
    std::string doc_path;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need_value = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << a << "\n";
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };

        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (a == "--config" || a == "--root")
        {
            const auto v = need_value();
            if (!v)
                return 2;
            (a == "--config" ? config_path : root_dir) = std::string(*v);
        }
        else if (a == "--width" || a == "--height")
        {
            const auto v = need_value();
            int n = 0;
            if (!v || !ParseInt(*v, n))
            {
                std::cerr << "Expected an integer for " << a << "\n";
                return 2;
            }
            (a == "--width" ? width : height) = n;
        }
        else if (a == "--line-numbers")
            line_numbers = true;
        else if (a == "--no-watch")
            no_watch = true;
        else if (a == "--verbose")
            verbose = true;
        else if (a == "--write-config")
            write_config = true;
        else if (!a.empty() && a[0] == '-')
        {
            std::cerr << "Unknown option: " << a << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
        else if (doc_path.empty())
            doc_path = std::string(a);
        else
        {
            std::cerr << "Only one document may be given\n";
            return 2;
        }
    }

    if (doc_path.empty() && !write_config)
    {
        PrintUsage(argv[0]);
        return 2;
    }

    const std::string cfg_path = config_path ? *config_path : ink::GetDefaultConfigPath();
    ink::PagerConfig cfg;
    {
        std::string err;
        if (!ink::LoadConfig(cfg_path, cfg, err))
            std::fprintf(stderr, "[config] %s (using defaults)\n", err.c_str());
    }
    if (root_dir)
        cfg.root_dir = *root_dir;
    if (width)
        cfg.width = *width;
    if (height)
        cfg.height = *height;
    if (line_numbers)
        cfg.show_line_numbers = true;
    if (no_watch)
        cfg.watch = false;
    if (verbose)
        cfg.verbose = true;
    ink::ClampConfig(cfg);

    if (write_config)
    {
        std::string err;
        if (!ink::SaveConfig(cfg_path, cfg, err))
        {
            std::fprintf(stderr, "[config] %s\n", err.c_str());
            return 1;
        }
        std::fprintf(stderr, "[config] wrote %s\n", cfg_path.c_str());
        return 0;
    }

    ink::links::RealFileSystem fs;

    // Absolute paths throughout, so watcher events compare equal to the document path.
    std::string err;
    std::string root_abs;
    if (!fs.Absolute(ink::io::EffectiveRootDir(cfg), root_abs, err))
    {
        std::fprintf(stderr, "[config] root dir: %s\n", err.c_str());
        return 1;
    }
    cfg.root_dir = root_abs;

    std::string doc_abs;
    if (!fs.Absolute(doc_path, doc_abs, err))
    {
        std::fprintf(stderr, "[load] %s: %s\n", doc_path.c_str(), err.c_str());
        return 1;
    }

    if (cfg.verbose)
        std::fprintf(stderr, "[config] root=%s width=%d height=%d watch=%s\n", cfg.root_dir.c_str(), cfg.width,
                     cfg.height, cfg.watch ? "on" : "off");

    // Shared with the stdin reader, which may outlive main's scope.
    auto events_owner = std::make_shared<ink::app::EventQueue>();
    ink::app::EventQueue& events = *events_owner;
    ink::app::Worker worker(fs, cfg, [&events](ink::app::AppEvent ev) { events.Push(std::move(ev)); });
    worker.Start();

    AppHost host(worker, events, cfg);

    ink::pager::PagerOptions popt;
    popt.width = cfg.width;
    popt.height = cfg.height;
    popt.watch = cfg.watch;
    popt.verbose = cfg.verbose;
    ink::pager::Pager pager(host, popt);

    // Blocks in getline, so it is detached rather than joined on quit.
    std::thread([events_owner]() {
        std::string line;
        while (std::getline(std::cin, line))
            events_owner->Push(ink::app::KeyEvent{LineToKey(line)});
        events_owner->Push(ink::app::InputClosedEvent{});
    }).detach();

    pager.Open(doc_abs);

    bool quit = false;
    while (!quit)
    {
        ink::app::AppEvent ev = events.WaitPop();
        bool redraw = true;

        std::visit(
            [&](auto& e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, ink::app::KeyEvent>)
                {
                    const ink::pager::KeyResult r = pager.HandleKey(e.key);
                    if (r == ink::pager::KeyResult::Quit)
                        quit = true;
                    else if (r == ink::pager::KeyResult::Ignored && cfg.verbose)
                        std::fprintf(stderr, "[pager] unknown key '%s'\n", e.key.c_str());
                }
                else if constexpr (std::is_same_v<T, ink::app::InputClosedEvent>)
                {
                    quit = true;
                }
                else if constexpr (std::is_same_v<T, ink::app::DocumentLoadedEvent>)
                {
                    redraw = false;
                    if (worker.IsCurrentLoad(e.gen))
                        pager.OnDocumentLoaded(std::move(e.doc));
                }
                else if constexpr (std::is_same_v<T, ink::app::ContentRenderedEvent>)
                {
                    redraw = worker.IsCurrentRender(e.gen);
                    if (redraw)
                        pager.OnContentRendered(std::move(e.rendered));
                }
                else if constexpr (std::is_same_v<T, ink::app::JobFailedEvent>)
                {
                    redraw = e.is_render ? worker.IsCurrentRender(e.gen) : worker.IsCurrentLoad(e.gen);
                    if (redraw)
                        pager.OnLoadFailed(e.err);
                }
                else if constexpr (std::is_same_v<T, ink::app::FileChangedEvent>)
                {
                    redraw = false;
                    if (host.IsCurrentWatch(e.watch_gen))
                        pager.OnFileChanged(e.change);
                }
            },
            ev);

        if (redraw && !quit)
            PrintView(pager);
    }

    pager.Unload();
    worker.Stop();
    return 0;
}
