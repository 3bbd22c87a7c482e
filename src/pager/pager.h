#pragma once

#include "io/dir_watcher.h"
#include "io/document_loader.h"
#include "links/link_registry.h"
#include "pager/nav_history.h"
#include "pager/viewport.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ink::pager
{
// Everything the pager asks of the outside world. Requests are fire-and-forget: results come
// back as Pager::On*() events on the same sequence that handles keys.
class PagerHost
{
public:
    virtual ~PagerHost() = default;

    // Load `path` from disk; answer with OnDocumentLoaded or OnLoadFailed.
    virtual void RequestLoad(const std::string& path, const std::string& note) = 0;

    // Render `markdown` at `width` columns; answer with OnContentRendered or OnLoadFailed.
    virtual void RequestRender(const std::string& markdown, int width) = 0;

    // Replace any directory watch with one on `dir`; changes arrive via OnFileChanged.
    virtual void WatchDirectory(const std::string& dir) = 0;
    virtual void StopWatching() = 0;
};

struct PagerOptions
{
    int width = 80;
    int height = 24;
    bool watch = true;
    bool verbose = false;
};

enum class KeyResult
{
    Handled = 0,
    Ignored,
    Quit,
};

// Pager state: the displayed document, its followable links, focus, history and scroll.
//
// Not thread-safe. Every method must be called from the single event-handling sequence.
class Pager
{
public:
    Pager(PagerHost& host, PagerOptions opt);

    // Requests the initial document.
    void Open(const std::string& path);

    void OnDocumentLoaded(io::LoadedDocument doc);
    void OnLoadFailed(const std::string& err);
    void OnContentRendered(std::string rendered);
    void OnFileChanged(const io::ChangeEvent& ev);
    void OnResize(int width, int height);

    // Key names: single characters, plus "tab", "shift-tab", "enter", "backspace", "space",
    // "up", "down", "pgup", "pgdn", "home", "end", "esc".
    KeyResult HandleKey(std::string_view key);

    // Back to the empty state; stops watching.
    void Unload();

    // Visible lines followed by the status line.
    std::string View() const;
    std::string StatusLine() const;

    bool HasDocument() const { return has_doc_; }
    const io::LoadedDocument& Document() const { return doc_; }
    const links::LinkRegistry& Links() const { return doc_.links; }
    int FocusedLink() const { return focused_; }
    const NavHistory& History() const { return history_; }
    const Viewport& GetViewport() const { return viewport_; }
    std::optional<int> PendingRestore() const { return pending_restore_; }
    const std::string& Content() const { return content_; }
    const std::string& StatusMessage() const { return status_; }
    bool StatusIsError() const { return status_is_error_; }

private:
    void FocusNext();
    void FocusPrev();
    void FollowFocusedLink();
    void GoBack();
    void Reload();

    void ApplyRenderedContent();
    void StartWatching();
    void StopWatching();

    void ShowStatus(std::string msg, bool is_error = false);
    void ClearStatus();

    PagerHost& host_;
    PagerOptions opt_;

    bool has_doc_ = false;
    io::LoadedDocument doc_;

    std::string rendered_; // renderer output, no highlight
    std::string content_;  // rendered_ with the focused link highlighted
    std::vector<std::string> lines_;

    int focused_ = -1;
    NavHistory history_;
    Viewport viewport_;
    std::optional<int> pending_restore_;

    std::string status_;
    bool status_is_error_ = false;

    std::string watched_dir_;
};
} // namespace ink::pager
