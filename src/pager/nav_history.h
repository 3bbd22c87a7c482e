#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ink::pager
{
// Where to return to: a document and the scroll offset it was left at.
struct NavEntry
{
    std::string path;
    int y_offset = 0;
};

// LIFO stack of visited documents. Unbounded; cleared when the pager unloads.
class NavHistory
{
public:
    void Push(NavEntry entry);

    // Removes the newest entry into `out`. Returns false (leaving `out` untouched) when empty.
    bool Pop(NavEntry& out);

    void Clear() { entries_.clear(); }

    bool Empty() const { return entries_.empty(); }
    std::size_t Size() const { return entries_.size(); }
    const std::vector<NavEntry>& Entries() const { return entries_; }

private:
    std::vector<NavEntry> entries_;
};
} // namespace ink::pager
