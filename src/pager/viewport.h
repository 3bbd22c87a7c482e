#pragma once

namespace ink::pager
{
// Vertical scroll state over a block of text lines.
//
// YOffset can be set past the bottom (a restored offset from an older, longer version of a
// document); callers check PastBottom() and clamp explicitly.
class Viewport
{
public:
    int Height() const { return height_; }
    void SetHeight(int height);

    int LineCount() const { return line_count_; }
    void SetLineCount(int lines);

    int YOffset() const { return y_offset_; }
    void SetYOffset(int y) { y_offset_ = y < 0 ? 0 : y; }

    int MaxYOffset() const;
    bool AtTop() const { return y_offset_ <= 0; }
    bool AtBottom() const { return y_offset_ >= MaxYOffset(); }
    bool PastBottom() const { return y_offset_ > MaxYOffset(); }

    void GotoTop() { y_offset_ = 0; }
    void GotoBottom() { y_offset_ = MaxYOffset(); }

    void LineDown(int n);
    void LineUp(int n);
    void HalfPageDown() { LineDown(HalfPage()); }
    void HalfPageUp() { LineUp(HalfPage()); }
    void PageDown() { LineDown(height_); }
    void PageUp() { LineUp(height_); }

    // 0..1; 1 when everything fits.
    double ScrollPercent() const;

private:
    int HalfPage() const { return height_ / 2 > 0 ? height_ / 2 : 1; }

    int height_ = 24;
    int line_count_ = 0;
    int y_offset_ = 0;
};
} // namespace ink::pager
