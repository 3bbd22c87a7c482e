#include "render/markdown_ansi.h"

#include "core/entities.h"
#include "core/md_text.h"
#include "core/utf8.h"

#include <md4c.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ink::render
{
namespace
{
static inline int ClampInt(int v, int lo, int hi)
{
    return (v < lo) ? lo : (v > hi) ? hi : v;
}

// ---------------------------------------------------------------------------
// Styles (fixed built-in palette, xterm-256 foreground indices)
// ---------------------------------------------------------------------------
enum Attr : std::uint8_t
{
    Attr_Bold = 1u << 0,
    Attr_Dim = 1u << 1,
    Attr_Italic = 1u << 2,
    Attr_Underline = 1u << 3,
    Attr_Strike = 1u << 4,
};

struct Style
{
    std::uint8_t attrs = 0;
    int fg = -1; // -1 = terminal default

    bool IsDefault() const { return attrs == 0 && fg < 0; }
    bool operator==(const Style& o) const { return attrs == o.attrs && fg == o.fg; }
    bool operator!=(const Style& o) const { return !(*this == o); }
};

static constexpr int kHeadingFg = 75;
static constexpr int kLinkFg = 38;
static constexpr int kCodeFg = 203;
static constexpr int kImageFg = 212;
static constexpr int kQuoteFg = 244;
static constexpr int kMarkerFg = 245;

static Style With(Style s, std::uint8_t attrs, int fg = -1)
{
    s.attrs = (std::uint8_t)(s.attrs | attrs);
    if (fg >= 0)
        s.fg = fg;
    return s;
}

// ---------------------------------------------------------------------------
// Layout (codepoint == 1 column)
// ---------------------------------------------------------------------------
struct Cell
{
    char32_t cp = U' ';
    Style style;
};

using Cells = std::vector<Cell>;

struct Line
{
    Cells cells;
};

struct Layout
{
    std::vector<Line> lines;
};

static void AppendCellsFromUtf8(Cells& dst, std::string_view s, const Style& st)
{
    size_t i = 0;
    while (i < s.size())
    {
        char32_t cp = U'\0';
        const size_t before = i;
        if (!utf8::DecodeOne(s.data(), s.size(), i, cp))
        {
            i = before + 1;
            cp = U'\uFFFD';
        }
        Cell c;
        c.cp = cp;
        c.style = st;
        dst.push_back(c);
    }
}

static Cells MakeCells(std::string_view s, const Style& st)
{
    Cells out;
    AppendCellsFromUtf8(out, s, st);
    return out;
}

static bool SameCells(const Cells& a, const Cells& b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (a[i].cp != b[i].cp || a[i].style != b[i].style)
            return false;
    }
    return true;
}

static Cells Concat(const Cells& a, const Cells& b)
{
    Cells out = a;
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

// Line prefixes for a block: `first` starts its first line, `rest` every following line
// (list bullets, quote bars, item indentation).
struct Margin
{
    Cells first;
    Cells rest;
    bool in_item = false;
};

// Accumulates one wrapped block of inline content.
class LineWriter
{
public:
    LineWriter(Layout& layout, int width, bool wrap, const Margin& m)
        : layout_(layout), width_(width), wrap_(wrap), rest_(m.rest)
    {
        cur_ = m.first;
        prefix_len_ = cur_.size();
        // Keep room for content even under deep nesting.
        width_ = std::max<int>(width_, (int)std::max(m.first.size(), m.rest.size()) + 10);
    }

    void Append(const Cells& run)
    {
        size_t i = 0;
        while (i < run.size())
        {
            const Cell& c = run[i];
            if (!wrap_ || (int)cur_.size() < width_)
            {
                // Drop leading spaces on continuation lines.
                if (!(wrap_ && c.cp == U' ' && cur_.size() == prefix_len_ && wrapped_))
                    cur_.push_back(c);
                ++i;
                continue;
            }

            // Line is full. A space right at the edge is the break itself.
            if (c.cp == U' ')
            {
                Break(true);
                ++i;
                continue;
            }

            // Otherwise wrap at the last space after the prefix.
            int last_space = -1;
            for (int k = (int)cur_.size() - 1; k > (int)prefix_len_; --k)
            {
                if (cur_[(size_t)k].cp == U' ')
                {
                    last_space = k;
                    break;
                }
            }

            if (last_space >= 0)
            {
                Cells carry(cur_.begin() + last_space + 1, cur_.end());
                cur_.resize((size_t)last_space);
                Break(true);
                cur_.insert(cur_.end(), carry.begin(), carry.end());
            }
            else
            {
                // No space to break: hard-wrap.
                Break(true);
            }
        }
    }

    void HardBreak() { Break(false); }

    void Finish()
    {
        layout_.lines.push_back(Line{std::move(cur_)});
        cur_.clear();
    }

private:
    void Break(bool wrapped)
    {
        layout_.lines.push_back(Line{std::move(cur_)});
        cur_ = rest_;
        prefix_len_ = cur_.size();
        wrapped_ = wrapped;
    }

    Layout& layout_;
    int width_ = 80;
    bool wrap_ = true;
    Cells rest_;
    Cells cur_;
    size_t prefix_len_ = 0;
    bool wrapped_ = false;
};

static void AppendBlank(Layout& layout, const Margin& m)
{
    // Blank separator lines keep quote bars but not bullets/indent-only padding.
    Cells bars = m.rest;
    while (!bars.empty() && bars.back().cp == U' ')
        bars.pop_back();
    layout.lines.push_back(Line{std::move(bars)});
}

// ---------------------------------------------------------------------------
// Streaming layout: md4c callbacks drive the line writer directly
// ---------------------------------------------------------------------------
enum class FrameKind
{
    Document,
    Container, // tables and their rows: children only
    Quote,
    List,
    Item,
    Leaf,      // paragraph, heading, code block, rule, table cell
};

// One open block.
struct Frame
{
    FrameKind kind = FrameKind::Document;
    Margin outer;     // given by the parent
    Margin inner;     // handed to child blocks
    int children = 0; // child blocks opened so far
    bool ordered = false;
    int next_number = 1;
};

class StreamRenderer
{
public:
    explicit StreamRenderer(const RenderOptions& opt)
        : opt_(opt)
    {
        frames_.emplace_back();
    }

    const std::string& Error() const { return error_; }
    Layout& Result() { return layout_; }

    int EnterBlock(MD_BLOCKTYPE type, void* detail)
    {
        if (!error_.empty())
            return 1;
        if (type == MD_BLOCK_DOC)
            return 0;
        if (frames_.size() >= kMaxDepth)
            return Fail("Markdown nesting too deep to render.");

        EndItemText();

        Frame f;
        f.kind = FrameKind::Leaf;
        f.outer = NextChildMargin();
        f.inner = f.outer;

        switch (type)
        {
            case MD_BLOCK_QUOTE:
            {
                const Cells bar = MakeCells("│ ", With(Style{}, 0, kQuoteFg));
                f.kind = FrameKind::Quote;
                f.inner.first = Concat(f.outer.first, bar);
                f.inner.rest = Concat(f.outer.rest, bar);
                break;
            }
            case MD_BLOCK_UL:
                f.kind = FrameKind::List;
                break;
            case MD_BLOCK_OL:
            {
                f.kind = FrameKind::List;
                f.ordered = true;
                if (auto* od = (MD_BLOCK_OL_DETAIL*)detail)
                    f.next_number = (int)od->start;
                break;
            }
            case MD_BLOCK_LI:
                f.kind = FrameKind::Item;
                break;
            case MD_BLOCK_TABLE:
            case MD_BLOCK_THEAD:
            case MD_BLOCK_TBODY:
            case MD_BLOCK_TR:
                f.kind = FrameKind::Container;
                break;
            case MD_BLOCK_HR:
                EmitRule(f.outer);
                break;
            case MD_BLOCK_CODE:
                in_code_block_ = true;
                code_.clear();
                break;
            case MD_BLOCK_H:
            {
                const int level = ClampInt(detail ? (int)((MD_BLOCK_H_DETAIL*)detail)->level : 1, 1, 6);
                const Style st = With(Style{}, Attr_Bold, kHeadingFg);
                OpenWriter(f.outer, false, st);
                writer_->Append(MakeCells(std::string((size_t)level, '#') + " ", st));
                break;
            }
            default:
                // Paragraphs, table cells, raw HTML blocks.
                OpenWriter(f.outer, true, Style{});
                break;
        }

        frames_.push_back(std::move(f));
        return 0;
    }

    int LeaveBlock(MD_BLOCKTYPE type)
    {
        if (!error_.empty())
            return 1;
        if (type == MD_BLOCK_DOC || frames_.size() <= 1)
            return 0;

        EndItemText();
        const Frame f = std::move(frames_.back());
        frames_.pop_back();

        if (f.kind == FrameKind::Quote)
        {
            // The last child's separator belongs outside the quote.
            Cells bars = f.inner.rest;
            while (!bars.empty() && bars.back().cp == U' ')
                bars.pop_back();
            if (!layout_.lines.empty() && SameCells(layout_.lines.back().cells, bars))
                layout_.lines.pop_back();
        }
        else if (type == MD_BLOCK_CODE)
        {
            EmitCode(f.outer);
        }
        else if (writer_)
        {
            writer_->Finish();
            writer_.reset();
        }

        const bool separated = f.kind == FrameKind::Quote || f.kind == FrameKind::List || f.kind == FrameKind::Leaf;
        if (separated && !f.outer.in_item)
            AppendBlank(layout_, f.outer);
        return 0;
    }

    int EnterSpan(MD_SPANTYPE type, void* detail)
    {
        if (!error_.empty())
            return 1;
        BeginItemText();

        const Style cur = CurrentStyle();
        switch (type)
        {
            case MD_SPAN_EM: styles_.push_back(With(cur, Attr_Italic)); break;
            case MD_SPAN_STRONG: styles_.push_back(With(cur, Attr_Bold)); break;
            case MD_SPAN_DEL: styles_.push_back(With(cur, Attr_Strike)); break;
            case MD_SPAN_CODE: styles_.push_back(With(cur, 0, kCodeFg)); break;
            case MD_SPAN_A:
            {
                auto* ad = (MD_SPAN_A_DETAIL*)detail;
                link_urls_.push_back(ad && ad->href.text ? std::string(ad->href.text, ad->href.size) : std::string());
                styles_.push_back(With(cur, Attr_Underline, kLinkFg));
                break;
            }
            case MD_SPAN_IMG:
                if (image_depth_++ == 0)
                    alt_.clear();
                styles_.push_back(cur);
                break;
            default:
                styles_.push_back(cur);
                break;
        }
        return 0;
    }

    int LeaveSpan(MD_SPANTYPE type)
    {
        if (!error_.empty())
            return 1;
        if (styles_.size() > 1)
            styles_.pop_back();

        if (type == MD_SPAN_A && !link_urls_.empty())
        {
            const std::string url = StripControls(link_urls_.back());
            link_urls_.pop_back();
            if (opt_.link_mode == RenderOptions::LinkMode::InlineUrl && !url.empty() && image_depth_ == 0)
                Write(" (" + url + ")", With(CurrentStyle(), Attr_Dim));
        }
        else if (type == MD_SPAN_IMG && image_depth_ > 0 && --image_depth_ == 0)
        {
            Write("Image: " + (alt_.empty() ? std::string("image") : alt_), With(CurrentStyle(), 0, kImageFg));
        }
        return 0;
    }

    int Text(MD_TEXTTYPE type, std::string_view s)
    {
        if (!error_.empty())
            return 1;

        if (in_code_block_)
        {
            if (type == MD_TEXT_ENTITY)
                code_ += DecodeHtmlEntity(s);
            else
                code_ += StripControls(s);
            return 0;
        }

        BeginItemText();

        // A hard break ends the line, except inside a link label, which stays one piece of text.
        if (type == MD_TEXT_BR && link_urls_.empty() && image_depth_ == 0)
        {
            if (writer_)
                writer_->HardBreak();
            return 0;
        }

        std::string visible;
        AppendVisibleText(type, s, visible);
        if (image_depth_ > 0)
            alt_ += visible;
        else
            Write(visible, CurrentStyle());
        return 0;
    }

private:
    static constexpr std::size_t kMaxDepth = 64;

    int Fail(const char* e)
    {
        if (error_.empty())
            error_ = e;
        return 1;
    }

    Style CurrentStyle() const { return styles_.empty() ? Style{} : styles_.back(); }

    Margin NextChildMargin()
    {
        Frame& parent = frames_.back();
        Margin m;
        if (parent.kind == FrameKind::List)
        {
            const std::string bullet = parent.ordered ? std::to_string(parent.next_number++) + ". " : std::string("• ");
            m.first = Concat(parent.children == 0 ? parent.outer.first : parent.outer.rest,
                             MakeCells(bullet, With(Style{}, 0, kMarkerFg)));
            m.rest = Concat(parent.outer.rest, MakeCells(std::string(utf8::CountUnits(bullet), ' '), Style{}));
            m.in_item = true;
        }
        else
        {
            m = parent.inner;
            if (parent.children > 0)
                m.first = parent.inner.rest;
        }
        parent.children++;
        return m;
    }

    void OpenWriter(const Margin& m, bool wrap, const Style& base)
    {
        writer_.emplace(layout_, opt_.width, wrap, m);
        styles_.assign(1, base);
    }

    // Tight list items carry their text directly, without a paragraph block.
    void BeginItemText()
    {
        Frame& f = frames_.back();
        if (!writer_ && f.kind == FrameKind::Item)
            OpenWriter(f.inner, true, Style{});
    }

    void EndItemText()
    {
        Frame& f = frames_.back();
        if (!writer_ || f.kind != FrameKind::Item)
            return;
        writer_->Finish();
        writer_.reset();
        f.inner.first = f.inner.rest;
        f.children++;
    }

    void Write(const std::string& s, const Style& st)
    {
        if (writer_ && !s.empty())
            writer_->Append(MakeCells(s, st));
    }

    void EmitRule(const Margin& m)
    {
        Cells ln = m.first;
        const int cols = std::max(3, opt_.width - (int)ln.size());
        const Style st = With(Style{}, 0, kMarkerFg);
        for (int i = 0; i < cols; ++i)
            ln.push_back(Cell{opt_.hr_glyph ? opt_.hr_glyph : U'-', st});
        layout_.lines.push_back(Line{std::move(ln)});
    }

    void EmitCode(const Margin& m)
    {
        in_code_block_ = false;
        const Style st = With(Style{}, 0, kCodeFg);
        std::string_view code = code_;
        if (!code.empty() && code.back() == '\n')
            code.remove_suffix(1);

        size_t start = 0;
        bool first = true;
        for (;;)
        {
            const size_t nl = code.find('\n', start);
            const size_t end = (nl == std::string_view::npos) ? code.size() : nl;

            Cells ln = first ? m.first : m.rest;
            AppendCellsFromUtf8(ln, "    ", Style{});
            AppendCellsFromUtf8(ln, code.substr(start, end - start), st);
            layout_.lines.push_back(Line{std::move(ln)});
            first = false;

            if (nl == std::string_view::npos)
                break;
            start = nl + 1;
        }
        code_.clear();
    }

    const RenderOptions& opt_;
    Layout layout_;
    std::vector<Frame> frames_;
    std::optional<LineWriter> writer_;
    std::vector<Style> styles_;

    std::vector<std::string> link_urls_; // hrefs of the open links, innermost last
    int image_depth_ = 0;
    std::string alt_;

    bool in_code_block_ = false;
    std::string code_;

    std::string error_;
};

// ---------------------------------------------------------------------------
// Emission
// ---------------------------------------------------------------------------
static void AppendSgr(std::string& out, const Style& st)
{
    std::string params;
    auto add = [&](std::string_view p) {
        if (!params.empty())
            params.push_back(';');
        params.append(p);
    };
    if (st.attrs & Attr_Bold) add("1");
    if (st.attrs & Attr_Dim) add("2");
    if (st.attrs & Attr_Italic) add("3");
    if (st.attrs & Attr_Underline) add("4");
    if (st.attrs & Attr_Strike) add("9");
    if (st.fg >= 0) add("38;5;" + std::to_string(st.fg));

    out += "\x1b[";
    out += params;
    out += 'm';
}

static void AppendLine(std::string& out, const Line& ln)
{
    Style cur;
    for (const Cell& c : ln.cells)
    {
        if (c.style != cur)
        {
            if (!cur.IsDefault())
                out += "\x1b[0m";
            if (!c.style.IsDefault())
                AppendSgr(out, c.style);
            cur = c.style;
        }
        utf8::AppendCodepoint(out, c.cp);
    }
    if (!cur.IsDefault())
        out += "\x1b[0m";
}
} // namespace

bool RenderMarkdownToAnsi(std::string_view markdown_utf8,
                          const RenderOptions& opt_in,
                          std::string& out,
                          std::string& err)
{
    err.clear();

    if (markdown_utf8.size() > opt_in.max_input_bytes)
    {
        err = "Markdown input too large to render.";
        return false;
    }

    RenderOptions opt = opt_in;
    opt.width = ClampInt(opt.width, 20, 400);
    if (opt.show_line_numbers)
        opt.width = std::max(20, opt.width - (kLineNumberWidth + 1));

    StreamRenderer r(opt);

    MD_PARSER parser;
    std::memset(&parser, 0, sizeof(parser));
    parser.flags = MD_FLAG_TABLES | MD_FLAG_STRIKETHROUGH | MD_FLAG_TASKLISTS;
    parser.enter_block = [](MD_BLOCKTYPE t, void* d, void* u) { return ((StreamRenderer*)u)->EnterBlock(t, d); };
    parser.leave_block = [](MD_BLOCKTYPE t, void*, void* u) { return ((StreamRenderer*)u)->LeaveBlock(t); };
    parser.enter_span = [](MD_SPANTYPE t, void* d, void* u) { return ((StreamRenderer*)u)->EnterSpan(t, d); };
    parser.leave_span = [](MD_SPANTYPE t, void*, void* u) { return ((StreamRenderer*)u)->LeaveSpan(t); };
    parser.text = [](MD_TEXTTYPE t, const MD_CHAR* s, MD_SIZE n, void* u) {
        return ((StreamRenderer*)u)->Text(t, std::string_view(s ? s : "", (size_t)n));
    };

    const int rc = md_parse(markdown_utf8.data(), (MD_SIZE)markdown_utf8.size(), &parser, &r);
    if (!r.Error().empty() || rc != 0)
    {
        err = r.Error().empty() ? std::string("Failed to parse Markdown.") : r.Error();
        return false;
    }

    Layout& layout = r.Result();
    while (!layout.lines.empty() && layout.lines.back().cells.empty())
        layout.lines.pop_back();

    std::string s;
    for (size_t i = 0; i < layout.lines.size(); ++i)
    {
        if (opt.show_line_numbers)
        {
            char num[32];
            std::snprintf(num, sizeof(num), "%*d", kLineNumberWidth, (int)(i + 1));
            s += "\x1b[2m";
            s += num;
            s += "\x1b[0m ";
        }
        AppendLine(s, layout.lines[i]);
        // No artificial newline after the last line.
        if (i + 1 < layout.lines.size())
            s.push_back('\n');
    }

    out = std::move(s);
    return true;
}
} // namespace ink::render
