#include "io/dir_watcher.h"

#include <filesystem>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ink::io
{
namespace
{
namespace fs = std::filesystem;

struct FileStamp
{
    std::uintmax_t size = 0;
    std::int64_t mtime = 0;

    bool operator==(const FileStamp& o) const { return size == o.size && mtime == o.mtime; }
    bool operator!=(const FileStamp& o) const { return !(*this == o); }
};

using Snapshot = std::unordered_map<std::string, FileStamp>;

// Fingerprints regular files by size + last_write_time; avoids reading contents.
static Snapshot ScanDir(const std::string& dir)
{
    Snapshot snap;
    // Non-throwing iteration: a directory removed mid-scan ends the scan instead of the thread.
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec))
    {
        const fs::directory_entry& entry = *it;
        std::error_code fec;
        if (!entry.is_regular_file(fec) || fec)
            continue;

        FileStamp st;
        {
            std::error_code sec;
            st.size = (std::uintmax_t)fs::file_size(entry.path(), sec);
            if (sec) st.size = 0;
        }
        {
            std::error_code tec;
            const auto ft = fs::last_write_time(entry.path(), tec);
            if (!tec)
                st.mtime = (std::int64_t)ft.time_since_epoch().count();
        }
        snap[(fs::path(dir) / entry.path().filename()).string()] = st;
    }
    return snap;
}

static std::vector<ChangeEvent> Diff(const Snapshot& before, const Snapshot& after)
{
    std::vector<ChangeEvent> out;
    for (const auto& [path, st] : after)
    {
        auto it = before.find(path);
        if (it == before.end())
            out.push_back(ChangeEvent{path, ChangeOp::Create});
        else if (it->second != st)
            out.push_back(ChangeEvent{path, ChangeOp::Write});
    }
    for (const auto& [path, st] : before)
    {
        if (after.find(path) == after.end())
            out.push_back(ChangeEvent{path, ChangeOp::Remove});
    }
    return out;
}
} // namespace

const char* ChangeOpName(ChangeOp op)
{
    switch (op)
    {
        case ChangeOp::Create: return "create";
        case ChangeOp::Write: return "write";
        case ChangeOp::Remove: return "remove";
    }
    return "?";
}

DirWatcher::DirWatcher(std::chrono::milliseconds interval)
    : interval_(interval)
{
}

DirWatcher::~DirWatcher()
{
    Stop();
}

bool DirWatcher::Start(const std::string& dir, Callback cb, std::string& err)
{
    err.clear();
    Stop();

    std::error_code ec;
    if (!fs::is_directory(dir, ec) || ec)
    {
        err = std::string("Not a directory: ") + dir;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mu_);
        stop_requested_ = false;
    }
    dir_ = dir;
    running_ = true;
    worker_ = std::thread([this, dir, cb = std::move(cb)]() { Run(dir, cb); });
    return true;
}

void DirWatcher::Stop()
{
    if (!running_)
        return;
    {
        std::lock_guard<std::mutex> lock(mu_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
    running_ = false;
    dir_.clear();
}

void DirWatcher::Run(std::string dir, Callback cb)
{
    Snapshot last = ScanDir(dir);
    for (;;)
    {
        {
            std::unique_lock<std::mutex> lock(mu_);
            if (cv_.wait_for(lock, interval_, [&]() { return stop_requested_; }))
                return;
        }

        Snapshot now = ScanDir(dir);
        const std::vector<ChangeEvent> changes = Diff(last, now);
        last = std::move(now);

        for (const ChangeEvent& ev : changes)
        {
            {
                // Re-check between callbacks so a Stop() mid-batch takes effect promptly.
                std::lock_guard<std::mutex> lock(mu_);
                if (stop_requested_)
                    return;
            }
            if (cb)
                cb(ev);
        }
    }
}
} // namespace ink::io
