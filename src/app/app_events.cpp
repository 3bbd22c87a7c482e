#include "app/app_events.h"

#include <utility>

namespace ink::app
{
void EventQueue::Push(AppEvent ev)
{
    {
        std::lock_guard<std::mutex> lock(mtx_);
        queue_.push_back(std::move(ev));
    }
    cv_.notify_one();
}

AppEvent EventQueue::WaitPop()
{
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [&]() { return !queue_.empty(); });
    AppEvent ev = std::move(queue_.front());
    queue_.pop_front();
    return ev;
}

bool EventQueue::TryPop(AppEvent& out)
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.empty())
        return false;
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}
} // namespace ink::app
