#include "terminal/LogicalScreen.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace TermCanvas::Terminal {

namespace {

constexpr int kDefaultWidth = 80;
constexpr int kDefaultHeight = 24;
constexpr int kDefaultTextWidth = 10;
constexpr int kDefaultTextHeight = 20;

void AppendUtf8(std::string& out, char32_t ch) {
    if (ch < 0x80) {
        out += static_cast<char>(ch);
    } else if (ch < 0x800) {
        out += static_cast<char>(0xC0 | (ch >> 6));
        out += static_cast<char>(0x80 | (ch & 0x3F));
    } else if (ch < 0x10000) {
        out += static_cast<char>(0xE0 | (ch >> 12));
        out += static_cast<char>(0x80 | ((ch >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (ch & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (ch >> 18));
        out += static_cast<char>(0x80 | ((ch >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((ch >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (ch & 0x3F));
    }
}

} // namespace

LogicalScreen::LogicalScreen()
    : LogicalScreen(kDefaultWidth, kDefaultHeight)
{
}

LogicalScreen::LogicalScreen(int width, int height)
    : m_width(0)
    , m_height(0)
    , m_borderStyle(BorderStyle::Single)
    , m_offsetX(0)
    , m_offsetY(0)
    , m_clipLeft(0)
    , m_clipTop(0)
    , m_clipRight(0)
    , m_clipBottom(0)
    , m_reallyCleared(true)
    , m_cursorVisible(false)
    , m_cursorX(0)
    , m_cursorY(0)
    , m_textWidth(kDefaultTextWidth)
    , m_textHeight(kDefaultTextHeight)
{
    Reallocate(width, height);
    spdlog::debug("LogicalScreen created: {}x{}", m_width, m_height);
}

LogicalScreen::~LogicalScreen() {
}

void LogicalScreen::Reallocate(int width, int height) {
    width = std::max(width, 0);
    height = std::max(height, 0);

    // Everything on screen is lost and must be redrawn
    m_logical.assign(static_cast<size_t>(width) * height, Cell());
    m_physical.assign(static_cast<size_t>(width) * height, Cell());
    m_forceRedraw.assign(static_cast<size_t>(width) * height, 0);
    m_width = width;
    m_height = height;

    ResetClipping();
    m_reallyCleared = true;
}

bool LogicalScreen::Translate(int x, int y, int& outX, int& outY) const {
    if (x < m_clipLeft || x >= m_clipRight || y < m_clipTop || y >= m_clipBottom) {
        return false;
    }
    outX = x + m_offsetX;
    outY = y + m_offsetY;
    return InGrid(outX, outY);
}

void LogicalScreen::InvalidateCell(int x, int y) {
    if (InGrid(x, y)) {
        m_forceRedraw[CellIndex(x, y)] = 1;
    }
}

void LogicalScreen::OnCellWritten(int x, int y) {
    // The cursor overlay is drawn by the backend on top of this cell, so
    // any change underneath it must repaint the overlay too.
    if (m_cursorVisible && x == m_cursorX && y == m_cursorY) {
        InvalidateCell(x, y);
    }
}

bool LogicalScreen::IsDirty() const {
    for (size_t i = 0; i < m_logical.size(); ++i) {
        if (m_forceRedraw[i] || m_logical[i] != m_physical[i]) {
            return true;
        }
        // Blink visibility alternates on the backend's timer
        if (m_logical[i].attr.IsBlink()) {
            return true;
        }
    }
    return false;
}

bool LogicalScreen::IsCellDirty(int x, int y) const {
    if (!InGrid(x, y)) {
        return false;
    }
    int idx = CellIndex(x, y);
    return m_forceRedraw[idx] ||
           m_logical[idx] != m_physical[idx] ||
           m_logical[idx].attr.IsBlink();
}

std::vector<CellPosition> LogicalScreen::GetDirtyCells() const {
    std::vector<CellPosition> dirty;
    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            if (IsCellDirty(x, y)) {
                dirty.push_back({x, y});
            }
        }
    }
    return dirty;
}

Cell LogicalScreen::GetPhysicalCell(int x, int y) const {
    if (!InGrid(x, y)) {
        return Cell();
    }
    return m_physical[CellIndex(x, y)];
}

CellAttributes LogicalScreen::GetAttrXY(int x, int y) const {
    if (!InGrid(x, y)) {
        return CellAttributes();
    }
    return m_logical[CellIndex(x, y)].attr;
}

Cell LogicalScreen::GetCharXY(int x, int y) const {
    if (!InGrid(x, y)) {
        return Cell();
    }
    return m_logical[CellIndex(x, y)];
}

void LogicalScreen::PutAttrXY(int x, int y, const CellAttributes& attr, bool clip) {
    int X = x;
    int Y = y;

    if (clip) {
        if (!Translate(x, y, X, Y)) {
            return;
        }
    } else if (!InGrid(X, Y)) {
        return;
    }

    m_logical[CellIndex(X, Y)].attr = attr;
    OnCellWritten(X, Y);
}

void LogicalScreen::PutAll(char32_t ch, const CellAttributes& attr) {
    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            PutCharXY(x, y, ch, attr);
        }
    }
}

void LogicalScreen::PutCharXY(int x, int y, const Cell& cell) {
    if (!cell.IsImage() && !IsPrintable(cell.ch)) {
        return;
    }

    int X, Y;
    if (!Translate(x, y, X, Y)) {
        return;
    }

    m_logical[CellIndex(X, Y)] = cell;
    OnCellWritten(X, Y);
}

void LogicalScreen::PutCharXY(int x, int y, char32_t ch, const CellAttributes& attr) {
    PutCharXY(x, y, Cell(ch, attr));
}

void LogicalScreen::PutCharXY(int x, int y, char32_t ch) {
    if (!IsPrintable(ch)) {
        return;
    }

    int X, Y;
    if (!Translate(x, y, X, Y)) {
        return;
    }

    Cell& cell = m_logical[CellIndex(X, Y)];
    cell.ch = ch;
    cell.imageId = 0;
    OnCellWritten(X, Y);
}

void LogicalScreen::PutStringXY(int x, int y, const std::u32string& str, const CellAttributes& attr) {
    int i = x;
    for (char32_t ch : str) {
        PutCharXY(i, y, ch, attr);
        i++;
        if (i == m_width) {
            break;
        }
    }
}

void LogicalScreen::PutStringXY(int x, int y, const std::u32string& str) {
    int i = x;
    for (char32_t ch : str) {
        PutCharXY(i, y, ch);
        i++;
        if (i == m_width) {
            break;
        }
    }
}

void LogicalScreen::VLineXY(int x, int y, int n, char32_t ch, const CellAttributes& attr) {
    for (int i = y; i < y + n; ++i) {
        PutCharXY(x, i, ch, attr);
    }
}

void LogicalScreen::HLineXY(int x, int y, int n, char32_t ch, const CellAttributes& attr) {
    for (int i = x; i < x + n; ++i) {
        PutCharXY(i, y, ch, attr);
    }
}

void LogicalScreen::SetWidth(int width) {
    SetDimensions(width, m_height);
}

void LogicalScreen::SetHeight(int height) {
    SetDimensions(m_width, height);
}

void LogicalScreen::SetDimensions(int width, int height) {
    spdlog::debug("LogicalScreen resize from {}x{} to {}x{}", m_width, m_height, width, height);
    Reallocate(width, height);
}

void LogicalScreen::Reset() {
    std::fill(m_logical.begin(), m_logical.end(), Cell());
    ResetClipping();
}

void LogicalScreen::ResetClipping() {
    m_offsetX = 0;
    m_offsetY = 0;
    m_clipLeft = 0;
    m_clipTop = 0;
    m_clipRight = m_width;
    m_clipBottom = m_height;
}

void LogicalScreen::Clear() {
    Reset();
}

void LogicalScreen::DrawBox(int left, int top, int right, int bottom,
                            const CellAttributes& border, const CellAttributes& background,
                            BoxStyle style, bool shadow) {
    DrawBox(left, top, right, bottom, border, background,
            BorderStyle::FromBoxStyle(style), shadow);
}

void LogicalScreen::DrawBox(int left, int top, int right, int bottom,
                            const CellAttributes& border, const CellAttributes& background,
                            const BorderStyle& borderStyle, bool shadow) {
    int boxWidth = right - left;
    int boxHeight = bottom - top;

    // Corners
    PutCharXY(left, top, borderStyle.topLeft, border);
    PutCharXY(left + boxWidth - 1, top, borderStyle.topRight, border);
    PutCharXY(left, top + boxHeight - 1, borderStyle.bottomLeft, border);
    PutCharXY(left + boxWidth - 1, top + boxHeight - 1, borderStyle.bottomRight, border);

    // Edges
    HLineXY(left + 1, top, boxWidth - 2, borderStyle.horizontal, border);
    VLineXY(left, top + 1, boxHeight - 2, borderStyle.vertical, border);
    HLineXY(left + 1, top + boxHeight - 1, boxWidth - 2, borderStyle.horizontal, border);
    VLineXY(left + boxWidth - 1, top + 1, boxHeight - 2, borderStyle.vertical, border);

    // Interior
    for (int i = 1; i < boxHeight - 1; ++i) {
        HLineXY(left + 1, top + i, boxWidth - 2, U' ', background);
    }

    if (shadow) {
        DrawBoxShadow(left, top, right, bottom);
    }
}

void LogicalScreen::DrawFrame(int left, int top, int right, int bottom,
                              const CellAttributes& border, const CellAttributes& background,
                              bool shadow) {
    DrawBox(left, top, right, bottom, border, background, m_borderStyle, shadow);
}

void LogicalScreen::DrawBoxShadow(int left, int top, int right, int bottom) {
    int boxWidth = right - left;
    int boxHeight = bottom - top;
    CellAttributes shadowAttr;

    // Shadows ignore the clip rectangle but still honor the offset
    auto putShadow = [&](int x, int y) {
        int X = x + m_offsetX;
        int Y = y + m_offsetY;
        if (!InGrid(X, Y)) {
            return;
        }
        m_logical[CellIndex(X, Y)].attr = shadowAttr;
        OnCellWritten(X, Y);
    };

    for (int i = 0; i < boxHeight; ++i) {
        putShadow(left + boxWidth, top + 1 + i);
        putShadow(left + boxWidth + 1, top + 1 + i);
    }
    for (int i = 0; i < boxWidth; ++i) {
        putShadow(left + 2 + i, top + boxHeight);
    }
}

void LogicalScreen::ClearPhysical() {
    std::fill(m_physical.begin(), m_physical.end(), Cell());
    std::fill(m_forceRedraw.begin(), m_forceRedraw.end(), 1);
}

void LogicalScreen::UnsetImageRow(int y) {
    if (y < 0 || y >= m_height) {
        return;
    }
    for (int x = 0; x < m_width; ++x) {
        Cell& cell = m_physical[CellIndex(x, y)];
        if (cell.IsImage()) {
            cell.Reset();
        }
    }
}

void LogicalScreen::FlushPhysical() {
    m_physical = m_logical;
    std::fill(m_forceRedraw.begin(), m_forceRedraw.end(), 0);
    m_reallyCleared = false;
}

void LogicalScreen::PutCursor(bool visible, int x, int y) {
    // The cell being left must lose the overlay
    if (m_cursorVisible) {
        InvalidateCell(m_cursorX, m_cursorY);
    }

    m_cursorVisible = visible;
    m_cursorX = x;
    m_cursorY = y;

    if (m_cursorVisible) {
        InvalidateCell(m_cursorX, m_cursorY);
    }
}

void LogicalScreen::HideCursor() {
    if (m_cursorVisible) {
        InvalidateCell(m_cursorX, m_cursorY);
    }
    m_cursorVisible = false;
}

void LogicalScreen::SetTextCellSize(int textWidth, int textHeight) {
    if (textWidth <= 0 || textHeight <= 0) {
        spdlog::warn("Ignoring invalid text cell size {}x{}", textWidth, textHeight);
        return;
    }
    m_textWidth = textWidth;
    m_textHeight = textHeight;
}

void LogicalScreen::InvertCell(int x, int y, bool onlyThisCell) {
    if (!InGrid(x, y)) {
        return;
    }

    Cell& cell = m_logical[CellIndex(x, y)];
    cell.attr.foreground = cell.attr.foreground.Inverted();
    cell.attr.background = cell.attr.background.Inverted();
    OnCellWritten(x, y);

    if (onlyThisCell) {
        return;
    }
    if (cell.attr.IsWideLeft()) {
        InvertCell(x + 1, y, true);
    } else if (cell.attr.IsWideRight()) {
        InvertCell(x - 1, y, true);
    }
}

template<typename Visitor>
void LogicalScreen::ForEachSelected(int x0, int y0, int x1, int y1, bool rectangle,
                                    Visitor&& visit) const {
    if (m_width == 0 || m_height == 0) {
        return;
    }

    if (rectangle) {
        int left = std::clamp(std::min(x0, x1), 0, m_width - 1);
        int right = std::clamp(std::max(x0, x1), 0, m_width - 1);
        int top = std::clamp(std::min(y0, y1), 0, m_height - 1);
        int bottom = std::clamp(std::max(y0, y1), 0, m_height - 1);
        for (int y = top; y <= bottom; ++y) {
            for (int x = left; x <= right; ++x) {
                visit(x, y, x == right);
            }
        }
        return;
    }

    // Stream selection: order the endpoints in reading order
    if (y0 > y1 || (y0 == y1 && x0 > x1)) {
        std::swap(x0, x1);
        std::swap(y0, y1);
    }
    int top = std::clamp(y0, 0, m_height - 1);
    int bottom = std::clamp(y1, 0, m_height - 1);
    for (int y = top; y <= bottom; ++y) {
        int startX = (y == y0) ? std::clamp(x0, 0, m_width - 1) : 0;
        int endX = (y == y1) ? std::clamp(x1, 0, m_width - 1) : m_width - 1;
        for (int x = startX; x <= endX; ++x) {
            visit(x, y, x == endX);
        }
    }
}

void LogicalScreen::SetSelection(int x0, int y0, int x1, int y1, bool rectangle) {
    std::vector<CellPosition> selected;
    ForEachSelected(x0, y0, x1, y1, rectangle,
        [&selected](int x, int y, bool) { selected.push_back({x, y}); });

    for (const auto& pos : selected) {
        InvertCell(pos.x, pos.y, true);
    }
}

std::string LogicalScreen::CopySelection(int x0, int y0, int x1, int y1, bool rectangle) const {
    std::string text;
    std::u32string line;
    bool firstLine = true;

    ForEachSelected(x0, y0, x1, y1, rectangle,
        [&](int x, int y, bool endOfRow) {
            const Cell& cell = m_logical[CellIndex(x, y)];
            if (!cell.IsImage() && !cell.attr.IsWideRight()) {
                line += cell.ch;
            }
            if (!endOfRow) {
                return;
            }

            while (!line.empty() && line.back() == U' ') {
                line.pop_back();
            }
            if (!firstLine) {
                text += '\n';
            }
            firstLine = false;
            for (char32_t ch : line) {
                AppendUtf8(text, ch);
            }
            line.clear();
        });

    return text;
}

std::unique_ptr<IScreen> LogicalScreen::Snapshot() const {
    return std::make_unique<LogicalScreen>(*this);
}

} // namespace TermCanvas::Terminal
