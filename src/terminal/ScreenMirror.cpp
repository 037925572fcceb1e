#include "terminal/ScreenMirror.h"
#include "terminal/LogicalScreen.h"
#include <algorithm>
#include <climits>
#include <spdlog/spdlog.h>

namespace TermCanvas::Terminal {

ScreenMirror::ScreenMirror(std::shared_ptr<IScreen> screen) {
    if (!screen) {
        spdlog::error("ScreenMirror created without a screen, using a default LogicalScreen");
        screen = std::make_shared<LogicalScreen>();
    }
    m_screens.push_back(std::move(screen));
}

void ScreenMirror::AddScreen(std::shared_ptr<IScreen> screen) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (!screen) {
        spdlog::warn("ScreenMirror: ignoring null screen");
        return;
    }
    if (std::find(m_screens.begin(), m_screens.end(), screen) != m_screens.end()) {
        spdlog::warn("ScreenMirror: screen is already a member");
        return;
    }
    // A mirror reachable from its own members would broadcast forever
    auto* mirror = dynamic_cast<ScreenMirror*>(screen.get());
    if (mirror == this || (mirror && mirror->Contains(this))) {
        spdlog::warn("ScreenMirror: refusing to add a mirror that contains this one");
        return;
    }

    m_screens.push_back(std::move(screen));
    spdlog::info("ScreenMirror: added screen ({} members)", m_screens.size());
}

void ScreenMirror::RemoveScreen(const std::shared_ptr<IScreen>& screen) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (m_screens.size() <= 1) {
        spdlog::debug("ScreenMirror: refusing to remove the last screen");
        return;
    }

    auto it = std::find(m_screens.begin(), m_screens.end(), screen);
    if (it == m_screens.end()) {
        return;
    }

    m_screens.erase(it);
    spdlog::info("ScreenMirror: removed screen ({} members)", m_screens.size());
}

bool ScreenMirror::Contains(const IScreen* screen) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    for (const auto& member : m_screens) {
        if (member.get() == screen) {
            return true;
        }
        auto* mirror = dynamic_cast<const ScreenMirror*>(member.get());
        if (mirror && mirror->Contains(screen)) {
            return true;
        }
    }
    return false;
}

size_t ScreenMirror::GetScreenCount() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_screens.size();
}

// ============================================================================
// Offset and clipping
// ============================================================================

void ScreenMirror::SetOffsetX(int offsetX) {
    Broadcast([=](IScreen& s) { s.SetOffsetX(offsetX); });
}

void ScreenMirror::SetOffsetY(int offsetY) {
    Broadcast([=](IScreen& s) { s.SetOffsetY(offsetY); });
}

int ScreenMirror::GetClipRight() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_screens.front()->GetClipRight();
}

void ScreenMirror::SetClipRight(int clipRight) {
    Broadcast([=](IScreen& s) { s.SetClipRight(clipRight); });
}

int ScreenMirror::GetClipBottom() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_screens.front()->GetClipBottom();
}

void ScreenMirror::SetClipBottom(int clipBottom) {
    Broadcast([=](IScreen& s) { s.SetClipBottom(clipBottom); });
}

int ScreenMirror::GetClipLeft() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_screens.front()->GetClipLeft();
}

void ScreenMirror::SetClipLeft(int clipLeft) {
    Broadcast([=](IScreen& s) { s.SetClipLeft(clipLeft); });
}

int ScreenMirror::GetClipTop() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_screens.front()->GetClipTop();
}

void ScreenMirror::SetClipTop(int clipTop) {
    Broadcast([=](IScreen& s) { s.SetClipTop(clipTop); });
}

// ============================================================================
// Dirty state and reads
// ============================================================================

bool ScreenMirror::IsDirty() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return std::any_of(m_screens.begin(), m_screens.end(),
                       [](const auto& s) { return s->IsDirty(); });
}

bool ScreenMirror::NeedsFullRedraw() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return std::any_of(m_screens.begin(), m_screens.end(),
                       [](const auto& s) { return s->NeedsFullRedraw(); });
}

CellAttributes ScreenMirror::GetAttrXY(int x, int y) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_screens.front()->GetAttrXY(x, y);
}

Cell ScreenMirror::GetCharXY(int x, int y) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_screens.front()->GetCharXY(x, y);
}

// ============================================================================
// Writes
// ============================================================================

void ScreenMirror::PutAttrXY(int x, int y, const CellAttributes& attr, bool clip) {
    Broadcast([&](IScreen& s) { s.PutAttrXY(x, y, attr, clip); });
}

void ScreenMirror::PutAll(char32_t ch, const CellAttributes& attr) {
    Broadcast([&](IScreen& s) { s.PutAll(ch, attr); });
}

void ScreenMirror::PutCharXY(int x, int y, const Cell& cell) {
    Broadcast([&](IScreen& s) { s.PutCharXY(x, y, cell); });
}

void ScreenMirror::PutCharXY(int x, int y, char32_t ch, const CellAttributes& attr) {
    Broadcast([&](IScreen& s) { s.PutCharXY(x, y, ch, attr); });
}

void ScreenMirror::PutCharXY(int x, int y, char32_t ch) {
    Broadcast([&](IScreen& s) { s.PutCharXY(x, y, ch); });
}

void ScreenMirror::PutStringXY(int x, int y, const std::u32string& str, const CellAttributes& attr) {
    Broadcast([&](IScreen& s) { s.PutStringXY(x, y, str, attr); });
}

void ScreenMirror::PutStringXY(int x, int y, const std::u32string& str) {
    Broadcast([&](IScreen& s) { s.PutStringXY(x, y, str); });
}

void ScreenMirror::VLineXY(int x, int y, int n, char32_t ch, const CellAttributes& attr) {
    Broadcast([&](IScreen& s) { s.VLineXY(x, y, n, ch, attr); });
}

void ScreenMirror::HLineXY(int x, int y, int n, char32_t ch, const CellAttributes& attr) {
    Broadcast([&](IScreen& s) { s.HLineXY(x, y, n, ch, attr); });
}

// ============================================================================
// Size
// ============================================================================

void ScreenMirror::ResizeMembers(int width, int height) {
    for (auto& screen : m_screens) {
        if (screen->GetWidth() != width || screen->GetHeight() != height) {
            screen->SetDimensions(width, height);
        } else {
            // Same size: keep the buffer, but repaint to stay in sync
            screen->ClearPhysical();
        }
    }
}

int ScreenMirror::MinWidth() const {
    int width = INT_MAX;
    for (const auto& screen : m_screens) {
        width = std::min(width, screen->GetWidth());
    }
    return width;
}

int ScreenMirror::MinHeight() const {
    int height = INT_MAX;
    for (const auto& screen : m_screens) {
        height = std::min(height, screen->GetHeight());
    }
    return height;
}

void ScreenMirror::SetWidth(int width) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    ResizeMembers(width, MinHeight());
}

void ScreenMirror::SetHeight(int height) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    ResizeMembers(MinWidth(), height);
}

void ScreenMirror::SetDimensions(int width, int height) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    spdlog::debug("ScreenMirror resize to {}x{} across {} screens", width, height, m_screens.size());
    ResizeMembers(width, height);
}

int ScreenMirror::GetWidth() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return MinWidth();
}

int ScreenMirror::GetHeight() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return MinHeight();
}

// ============================================================================
// Clearing, boxes, physical screen
// ============================================================================

void ScreenMirror::Reset() {
    Broadcast([](IScreen& s) { s.Reset(); });
}

void ScreenMirror::ResetClipping() {
    Broadcast([](IScreen& s) { s.ResetClipping(); });
}

void ScreenMirror::Clear() {
    Broadcast([](IScreen& s) { s.Clear(); });
}

void ScreenMirror::DrawBox(int left, int top, int right, int bottom,
                           const CellAttributes& border, const CellAttributes& background,
                           BoxStyle style, bool shadow) {
    Broadcast([&](IScreen& s) {
        s.DrawBox(left, top, right, bottom, border, background, style, shadow);
    });
}

void ScreenMirror::DrawBox(int left, int top, int right, int bottom,
                           const CellAttributes& border, const CellAttributes& background,
                           const BorderStyle& borderStyle, bool shadow) {
    Broadcast([&](IScreen& s) {
        s.DrawBox(left, top, right, bottom, border, background, borderStyle, shadow);
    });
}

void ScreenMirror::DrawBoxShadow(int left, int top, int right, int bottom) {
    Broadcast([=](IScreen& s) { s.DrawBoxShadow(left, top, right, bottom); });
}

void ScreenMirror::ClearPhysical() {
    Broadcast([](IScreen& s) { s.ClearPhysical(); });
}

void ScreenMirror::UnsetImageRow(int y) {
    Broadcast([=](IScreen& s) { s.UnsetImageRow(y); });
}

void ScreenMirror::FlushPhysical() {
    Broadcast([](IScreen& s) { s.FlushPhysical(); });
}

// ============================================================================
// Cursor and metadata
// ============================================================================

void ScreenMirror::PutCursor(bool visible, int x, int y) {
    Broadcast([=](IScreen& s) { s.PutCursor(visible, x, y); });
}

void ScreenMirror::HideCursor() {
    Broadcast([](IScreen& s) { s.HideCursor(); });
}

bool ScreenMirror::IsCursorVisible() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_screens.front()->IsCursorVisible();
}

int ScreenMirror::GetCursorX() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_screens.front()->GetCursorX();
}

int ScreenMirror::GetCursorY() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_screens.front()->GetCursorY();
}

void ScreenMirror::SetTitle(const std::string& title) {
    Broadcast([&](IScreen& s) { s.SetTitle(title); });
}

std::string ScreenMirror::GetTitle() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_screens.front()->GetTitle();
}

int ScreenMirror::GetTextWidth() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_screens.front()->GetTextWidth();
}

int ScreenMirror::GetTextHeight() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_screens.front()->GetTextHeight();
}

// ============================================================================
// Selection
// ============================================================================

void ScreenMirror::InvertCell(int x, int y, bool onlyThisCell) {
    Broadcast([=](IScreen& s) { s.InvertCell(x, y, onlyThisCell); });
}

void ScreenMirror::SetSelection(int x0, int y0, int x1, int y1, bool rectangle) {
    Broadcast([=](IScreen& s) { s.SetSelection(x0, y0, x1, y1, rectangle); });
}

std::string ScreenMirror::CopySelection(int x0, int y0, int x1, int y1, bool rectangle) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_screens.front()->CopySelection(x0, y0, x1, y1, rectangle);
}

std::unique_ptr<IScreen> ScreenMirror::Snapshot() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_screens.front()->Snapshot();
}

} // namespace TermCanvas::Terminal
