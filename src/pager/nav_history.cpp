#include "pager/nav_history.h"

#include <utility>

namespace ink::pager
{
void NavHistory::Push(NavEntry entry)
{
    entries_.push_back(std::move(entry));
}

bool NavHistory::Pop(NavEntry& out)
{
    if (entries_.empty())
        return false;
    out = std::move(entries_.back());
    entries_.pop_back();
    return true;
}
} // namespace ink::pager
