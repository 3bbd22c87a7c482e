#include "pager/pager.h"

#include "links/file_system.h"
#include "text/ansi_highlight.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace ink::pager
{
namespace
{
static std::vector<std::string> SplitLines(const std::string& s)
{
    std::vector<std::string> out;
    if (s.empty())
        return out;
    size_t start = 0;
    for (;;)
    {
        const size_t nl = s.find('\n', start);
        if (nl == std::string::npos)
        {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, nl - start));
        start = nl + 1;
    }
    return out;
}
} // namespace

Pager::Pager(PagerHost& host, PagerOptions opt)
    : host_(host)
    , opt_(std::move(opt))
{
    viewport_.SetHeight(opt_.height);
}

void Pager::Open(const std::string& path)
{
    host_.RequestLoad(path, std::string());
}

void Pager::OnDocumentLoaded(io::LoadedDocument doc)
{
    doc_ = std::move(doc);
    has_doc_ = true;
    focused_ = -1;

    if (opt_.verbose)
        std::fprintf(stderr, "[pager] loaded %s (%zu followable links)\n", doc_.local_path.c_str(), doc_.links.Size());

    host_.RequestRender(doc_.body, opt_.width);
}

void Pager::OnLoadFailed(const std::string& err)
{
    pending_restore_.reset();
    ShowStatus(err, true);

    // The displayed document is unchanged; resume watching it if navigation had stopped the watch.
    if (!rendered_.empty())
        StartWatching();
}

void Pager::OnContentRendered(std::string rendered)
{
    rendered_ = std::move(rendered);
    ApplyRenderedContent();

    if (pending_restore_)
    {
        viewport_.SetYOffset(*pending_restore_);
        if (viewport_.PastBottom())
            viewport_.GotoBottom();
        pending_restore_.reset();
    }

    StartWatching();
}

void Pager::OnFileChanged(const io::ChangeEvent& ev)
{
    // Events still queued from a watch that was stopped for navigation are stale.
    if (!has_doc_ || watched_dir_.empty() || ev.path != doc_.local_path)
        return;
    if (ev.op != io::ChangeOp::Create && ev.op != io::ChangeOp::Write)
        return;

    if (opt_.verbose)
        std::fprintf(stderr, "[pager] %s changed (%s), reloading\n", ev.path.c_str(), io::ChangeOpName(ev.op));
    Reload();
}

void Pager::OnResize(int width, int height)
{
    opt_.width = width;
    opt_.height = height;
    viewport_.SetHeight(height);
    if (viewport_.PastBottom())
        viewport_.GotoBottom();

    if (has_doc_)
        host_.RequestRender(doc_.body, opt_.width);
}

KeyResult Pager::HandleKey(std::string_view key)
{
    // Status messages last until the next key.
    ClearStatus();

    if (key == "q")
        return KeyResult::Quit;

    if (key == "tab" || key == "n")
        FocusNext();
    else if (key == "shift-tab" || key == "backtab" || key == "p")
        FocusPrev();
    else if (key == "enter" || key == "f")
    {
        if (focused_ >= 0 && focused_ < (int)doc_.links.Size())
            FollowFocusedLink();
        else if (!doc_.links.Empty())
            ShowStatus("Tab to select a link");
    }
    else if (key == "backspace" || key == "b")
        GoBack();
    else if (key == "j" || key == "down")
        viewport_.LineDown(1);
    else if (key == "k" || key == "up")
        viewport_.LineUp(1);
    else if (key == "d")
        viewport_.HalfPageDown();
    else if (key == "u")
        viewport_.HalfPageUp();
    else if (key == "space" || key == "pgdn")
        viewport_.PageDown();
    else if (key == "pgup")
        viewport_.PageUp();
    else if (key == "g" || key == "home")
        viewport_.GotoTop();
    else if (key == "G" || key == "end")
        viewport_.GotoBottom();
    else if (key == "r")
        Reload();
    else if (key == "esc")
    {
        // Status already cleared.
    }
    else
        return KeyResult::Ignored;

    return KeyResult::Handled;
}

void Pager::Unload()
{
    StopWatching();

    has_doc_ = false;
    doc_ = io::LoadedDocument{};
    rendered_.clear();
    content_.clear();
    lines_.clear();
    viewport_.SetLineCount(0);
    viewport_.GotoTop();

    focused_ = -1;
    history_.Clear();
    pending_restore_.reset();
    ClearStatus();
}

std::string Pager::View() const
{
    std::string out;
    const int first = viewport_.YOffset();
    const int last = std::min((int)lines_.size(), first + viewport_.Height());
    for (int i = first; i < last; ++i)
    {
        out += lines_[(size_t)i];
        out.push_back('\n');
    }
    out += StatusLine();
    return out;
}

std::string Pager::StatusLine() const
{
    const std::string& note = status_.empty() ? doc_.note : status_;

    char pct[16];
    std::snprintf(pct, sizeof(pct), "%3.f%%", std::round(viewport_.ScrollPercent() * 100.0));

    std::string out;
    if (status_is_error_)
        out += "Error: ";
    out += note;
    out += "  ";
    out += pct;
    return out;
}

void Pager::FocusNext()
{
    const int n = (int)doc_.links.Size();
    if (n == 0)
    {
        ShowStatus("No followable links");
        return;
    }
    focused_ = focused_ < 0 ? 0 : (focused_ + 1) % n;
    ApplyRenderedContent();
    ShowStatus("Open: " + doc_.links.At((size_t)focused_).resolved_note);
}

void Pager::FocusPrev()
{
    const int n = (int)doc_.links.Size();
    if (n == 0)
    {
        ShowStatus("No followable links");
        return;
    }
    focused_ = focused_ <= 0 ? n - 1 : focused_ - 1;
    ApplyRenderedContent();
    ShowStatus("Open: " + doc_.links.At((size_t)focused_).resolved_note);
}

void Pager::FollowFocusedLink()
{
    const links::FollowableLink& link = doc_.links.At((size_t)focused_);
    if (link.resolved_path.empty())
        return;

    if (!doc_.local_path.empty())
        history_.Push(NavEntry{doc_.local_path, viewport_.YOffset()});

    focused_ = -1;
    ApplyRenderedContent();
    viewport_.GotoTop();
    pending_restore_.reset();

    // A change to the outgoing document must not queue a reload over this load.
    StopWatching();
    host_.RequestLoad(link.resolved_path, link.resolved_note);
}

void Pager::GoBack()
{
    NavEntry last;
    if (!history_.Pop(last))
    {
        ShowStatus("No previous document");
        return;
    }

    focused_ = -1;
    ApplyRenderedContent();
    pending_restore_ = last.y_offset;
    viewport_.GotoTop();

    // The loader derives the note from the symlink-evaluated root.
    StopWatching();
    host_.RequestLoad(last.path, std::string());
}

void Pager::Reload()
{
    if (!has_doc_ || doc_.local_path.empty())
        return;
    host_.RequestLoad(doc_.local_path, doc_.note);
}

void Pager::ApplyRenderedContent()
{
    content_ = focused_ >= 0 ? text::HighlightFocusedLink(rendered_, doc_.links, focused_) : rendered_;
    lines_ = SplitLines(content_);
    viewport_.SetLineCount((int)lines_.size());
}

void Pager::StartWatching()
{
    if (!opt_.watch || !has_doc_ || doc_.local_path.empty())
        return;

    StopWatching();

    watched_dir_ = links::DirOf(doc_.local_path);
    host_.WatchDirectory(watched_dir_);
}

void Pager::StopWatching()
{
    if (watched_dir_.empty())
        return;
    host_.StopWatching();
    watched_dir_.clear();
}

void Pager::ShowStatus(std::string msg, bool is_error)
{
    status_ = std::move(msg);
    status_is_error_ = is_error;
}

void Pager::ClearStatus()
{
    status_.clear();
    status_is_error_ = false;
}
} // namespace ink::pager
