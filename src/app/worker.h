#pragma once

#include "app/app_events.h"
#include "core/config.h"
#include "links/file_system.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace ink::app
{
// Background thread for document loads and renders.
//
// One pending slot per job kind: enqueuing replaces a job that has not started yet. Each job
// carries a generation number; results of superseded generations are never posted, and
// IsCurrent*() lets the consumer drop results that were already queued when a newer job arrived.
class Worker
{
public:
    using PostFn = std::function<void(AppEvent)>;

    Worker(const links::FileSystem& fs, PagerConfig cfg, PostFn post);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    void Start();
    void Stop();

    std::uint64_t EnqueueLoad(const std::string& path, const std::string& note);
    std::uint64_t EnqueueRender(const std::string& markdown, int width);

    bool IsCurrentLoad(std::uint64_t gen) const { return gen == load_gen_.load(); }
    bool IsCurrentRender(std::uint64_t gen) const { return gen == render_gen_.load(); }

private:
    struct LoadJob
    {
        std::uint64_t gen = 0;
        std::string path;
        std::string note;
    };

    struct RenderJob
    {
        std::uint64_t gen = 0;
        std::string markdown;
        int width = 80;
    };

    void Run();
    void RunLoad(const LoadJob& job);
    void RunRender(const RenderJob& job);

    const links::FileSystem& fs_;
    PagerConfig cfg_;
    PostFn post_;

    std::thread worker_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool worker_running_ = false;

    std::optional<LoadJob> pending_load_;
    std::optional<RenderJob> pending_render_;

    std::atomic<std::uint64_t> load_gen_{0};
    std::atomic<std::uint64_t> render_gen_{0};
};
} // namespace ink::app
