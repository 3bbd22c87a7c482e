#pragma once

#include "io/dir_watcher.h"
#include "io/document_loader.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <variant>

namespace ink::app
{
// One line of stdin, mapped to a key name.
struct KeyEvent
{
    std::string key;
};

// stdin closed.
struct InputClosedEvent
{
};

struct DocumentLoadedEvent
{
    std::uint64_t gen = 0;
    io::LoadedDocument doc;
};

struct ContentRenderedEvent
{
    std::uint64_t gen = 0;
    std::string rendered;
};

// A load or render job failed.
struct JobFailedEvent
{
    bool is_render = false;
    std::uint64_t gen = 0;
    std::string err;
};

struct FileChangedEvent
{
    std::uint64_t watch_gen = 0; // drops events from a watch that has since been replaced
    io::ChangeEvent change;
};

using AppEvent = std::variant<KeyEvent, InputClosedEvent, DocumentLoadedEvent, ContentRenderedEvent, JobFailedEvent,
                              FileChangedEvent>;

// Thread-safe FIFO feeding the main event sequence. Producers: stdin reader, worker, watcher.
class EventQueue
{
public:
    void Push(AppEvent ev);

    // Blocks until an event is available.
    AppEvent WaitPop();

    // Non-blocking; returns false when empty.
    bool TryPop(AppEvent& out);

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<AppEvent> queue_;
};
} // namespace ink::app
