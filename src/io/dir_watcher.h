#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace ink::io
{
enum class ChangeOp
{
    Create = 0,
    Write,
    Remove,
};

struct ChangeEvent
{
    std::string path; // watched dir joined with the file name
    ChangeOp op = ChangeOp::Write;
};

const char* ChangeOpName(ChangeOp op);

// Watches a single directory for changes to the regular files directly inside it.
//
// A polling worker thread fingerprints each file (size + last write time) every `interval` and
// reports differences through the callback, on the worker thread. Start() replaces any previous
// watch; Stop() cancels and joins, so no callback runs once it returns. The callback must not
// call Start()/Stop() itself.
class DirWatcher
{
public:
    using Callback = std::function<void(const ChangeEvent&)>;

    explicit DirWatcher(std::chrono::milliseconds interval = std::chrono::milliseconds(250));
    ~DirWatcher();

    DirWatcher(const DirWatcher&) = delete;
    DirWatcher& operator=(const DirWatcher&) = delete;

    bool Start(const std::string& dir, Callback cb, std::string& err);
    void Stop();

    bool IsWatching() const { return running_; }
    const std::string& WatchedDir() const { return dir_; }

private:
    void Run(std::string dir, Callback cb);

    const std::chrono::milliseconds interval_;
    std::string dir_;

    std::thread worker_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool running_ = false;
    bool stop_requested_ = false;
};
} // namespace ink::io
