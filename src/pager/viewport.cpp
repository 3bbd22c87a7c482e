#include "pager/viewport.h"

#include <algorithm>

namespace ink::pager
{
void Viewport::SetHeight(int height)
{
    height_ = std::max(1, height);
}

void Viewport::SetLineCount(int lines)
{
    line_count_ = std::max(0, lines);
}

int Viewport::MaxYOffset() const
{
    return std::max(0, line_count_ - height_);
}

void Viewport::LineDown(int n)
{
    if (n <= 0)
        return;
    y_offset_ = std::min(MaxYOffset(), y_offset_ + n);
}

void Viewport::LineUp(int n)
{
    if (n <= 0)
        return;
    y_offset_ = std::max(0, y_offset_ - n);
}

double Viewport::ScrollPercent() const
{
    if (height_ >= line_count_)
        return 1.0;
    const double y = (double)y_offset_;
    const double h = (double)height_;
    const double t = (double)line_count_;
    const double v = y / (t - h);
    return std::clamp(v, 0.0, 1.0);
}
} // namespace ink::pager
