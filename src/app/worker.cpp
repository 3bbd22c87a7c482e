#include "app/worker.h"

#include "io/document_loader.h"
#include "render/markdown_ansi.h"

#include <cstdio>
#include <utility>

namespace ink::app
{
Worker::Worker(const links::FileSystem& fs, PagerConfig cfg, PostFn post)
    : fs_(fs)
    , cfg_(std::move(cfg))
    , post_(std::move(post))
{
}

Worker::~Worker()
{
    Stop();
}

void Worker::Start()
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (worker_running_)
            return;
        worker_running_ = true;
    }
    worker_ = std::thread([this]() { Run(); });
}

void Worker::Stop()
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!worker_running_)
            return;
        worker_running_ = false;
        pending_load_.reset();
        pending_render_.reset();
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
}

std::uint64_t Worker::EnqueueLoad(const std::string& path, const std::string& note)
{
    LoadJob j;
    j.gen = ++load_gen_;
    j.path = path;
    j.note = note;

    const std::uint64_t gen = j.gen;
    {
        std::lock_guard<std::mutex> lock(mu_);
        pending_load_ = std::move(j);
    }
    cv_.notify_one();
    return gen;
}

std::uint64_t Worker::EnqueueRender(const std::string& markdown, int width)
{
    RenderJob j;
    j.gen = ++render_gen_;
    j.markdown = markdown;
    j.width = width;

    const std::uint64_t gen = j.gen;
    {
        std::lock_guard<std::mutex> lock(mu_);
        pending_render_ = std::move(j);
    }
    cv_.notify_one();
    return gen;
}

void Worker::Run()
{
    for (;;)
    {
        std::optional<LoadJob> load;
        std::optional<RenderJob> render;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [&]() { return !worker_running_ || pending_load_ || pending_render_; });
            if (!worker_running_)
                return;
            // Loads first: a render queued alongside a load is usually for the outgoing document.
            if (pending_load_)
            {
                load = std::move(pending_load_);
                pending_load_.reset();
            }
            else
            {
                render = std::move(pending_render_);
                pending_render_.reset();
            }
        }

        if (load)
            RunLoad(*load);
        else if (render)
            RunRender(*render);
    }
}

void Worker::RunLoad(const LoadJob& job)
{
    io::LoadedDocument doc;
    std::string err;
    const bool ok = io::LoadLocalDocument(fs_, cfg_, job.path, doc, err);

    if (!IsCurrentLoad(job.gen))
        return;

    if (!ok)
    {
        std::fprintf(stderr, "[load] %s\n", err.c_str());
        post_(JobFailedEvent{false, job.gen, std::move(err)});
        return;
    }

    if (!job.note.empty())
        doc.note = job.note;
    if (cfg_.verbose)
        std::fprintf(stderr, "[load] %s: %zu bytes\n", doc.local_path.c_str(), doc.body.size());
    post_(DocumentLoadedEvent{job.gen, std::move(doc)});
}

void Worker::RunRender(const RenderJob& job)
{
    render::RenderOptions opt;
    opt.width = job.width;
    opt.show_line_numbers = cfg_.show_line_numbers;
    opt.link_mode = cfg_.link_mode == PagerConfig::LinkMode::InlineUrl ? render::RenderOptions::LinkMode::InlineUrl
                                                                        : render::RenderOptions::LinkMode::TextOnly;
    opt.max_input_bytes = cfg_.max_input_bytes;

    std::string out;
    std::string err;
    const bool ok = render::RenderMarkdownToAnsi(job.markdown, opt, out, err);

    if (!IsCurrentRender(job.gen))
        return;

    if (!ok)
    {
        std::fprintf(stderr, "[render] %s\n", err.c_str());
        post_(JobFailedEvent{true, job.gen, std::move(err)});
        return;
    }
    post_(ContentRenderedEvent{job.gen, std::move(out)});
}
} // namespace ink::app
