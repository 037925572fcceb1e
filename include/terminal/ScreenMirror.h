#pragma once

#include "terminal/IScreen.h"
#include <memory>
#include <mutex>
#include <vector>

namespace TermCanvas::Terminal {

/**
 * @brief Screen that drives several member screens in lock-step
 *
 * Used when one session is shown on more than one surface (shared
 * sessions, a local window plus a remote viewer). Every mutation is
 * broadcast to all members; queries about what can be drawn report the
 * most restrictive member so a writer never addresses cells that one of
 * the surfaces cannot hold.
 *
 * All operations take the same mutex, members may be flushed from
 * different backend threads.
 */
class ScreenMirror : public IScreen {
public:
    explicit ScreenMirror(std::shared_ptr<IScreen> screen);
    ~ScreenMirror() override = default;

    // Non-copyable
    ScreenMirror(const ScreenMirror&) = delete;
    ScreenMirror& operator=(const ScreenMirror&) = delete;

    // Membership
    void AddScreen(std::shared_ptr<IScreen> screen);
    void RemoveScreen(const std::shared_ptr<IScreen>& screen);
    size_t GetScreenCount() const;

    // True if screen is a member here or in a nested mirror
    bool Contains(const IScreen* screen) const;

    void SetOffsetX(int offsetX) override;
    void SetOffsetY(int offsetY) override;

    int GetClipRight() const override;
    void SetClipRight(int clipRight) override;
    int GetClipBottom() const override;
    void SetClipBottom(int clipBottom) override;
    int GetClipLeft() const override;
    void SetClipLeft(int clipLeft) override;
    int GetClipTop() const override;
    void SetClipTop(int clipTop) override;

    bool IsDirty() const override;
    bool NeedsFullRedraw() const override;

    CellAttributes GetAttrXY(int x, int y) const override;
    Cell GetCharXY(int x, int y) const override;

    void PutAttrXY(int x, int y, const CellAttributes& attr, bool clip = true) override;
    void PutAll(char32_t ch, const CellAttributes& attr) override;
    void PutCharXY(int x, int y, const Cell& cell) override;
    void PutCharXY(int x, int y, char32_t ch, const CellAttributes& attr) override;
    void PutCharXY(int x, int y, char32_t ch) override;
    void PutStringXY(int x, int y, const std::u32string& str, const CellAttributes& attr) override;
    void PutStringXY(int x, int y, const std::u32string& str) override;
    void VLineXY(int x, int y, int n, char32_t ch, const CellAttributes& attr) override;
    void HLineXY(int x, int y, int n, char32_t ch, const CellAttributes& attr) override;

    void SetWidth(int width) override;
    void SetHeight(int height) override;

    // Resizes only the members whose size differs; the others just repaint
    void SetDimensions(int width, int height) override;

    // Smallest size across members
    int GetWidth() const override;
    int GetHeight() const override;

    void Reset() override;
    void ResetClipping() override;
    void Clear() override;

    void DrawBox(int left, int top, int right, int bottom,
                 const CellAttributes& border, const CellAttributes& background,
                 BoxStyle style = BoxStyle::Single, bool shadow = false) override;
    void DrawBox(int left, int top, int right, int bottom,
                 const CellAttributes& border, const CellAttributes& background,
                 const BorderStyle& borderStyle, bool shadow) override;
    void DrawBoxShadow(int left, int top, int right, int bottom) override;

    void ClearPhysical() override;
    void UnsetImageRow(int y) override;
    void FlushPhysical() override;

    void PutCursor(bool visible, int x, int y) override;
    void HideCursor() override;
    bool IsCursorVisible() const override;
    int GetCursorX() const override;
    int GetCursorY() const override;

    void SetTitle(const std::string& title) override;
    std::string GetTitle() const override;
    int GetTextWidth() const override;
    int GetTextHeight() const override;

    void InvertCell(int x, int y, bool onlyThisCell = false) override;
    void SetSelection(int x0, int y0, int x1, int y1, bool rectangle) override;
    std::string CopySelection(int x0, int y0, int x1, int y1, bool rectangle) const override;

    std::unique_ptr<IScreen> Snapshot() const override;

private:
    // Callers hold m_mutex
    void ResizeMembers(int width, int height);
    int MinWidth() const;
    int MinHeight() const;

    template<typename Fn>
    void Broadcast(Fn&& fn) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        for (auto& screen : m_screens) {
            fn(*screen);
        }
    }

    mutable std::recursive_mutex m_mutex;
    std::vector<std::shared_ptr<IScreen>> m_screens;
};

} // namespace TermCanvas::Terminal
