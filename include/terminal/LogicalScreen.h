#pragma once

#include "terminal/IScreen.h"
#include <cstdint>
#include <string>
#include <vector>

namespace TermCanvas::Terminal {

struct CellPosition {
    int x;
    int y;

    bool operator==(const CellPosition& other) const { return x == other.x && y == other.y; }
};

/**
 * @brief Grid-backed screen with a logical and a physical copy
 *
 * The logical grid is what the application wants shown, the physical grid
 * is what was last flushed to the device. A cell is dirty when the two
 * differ, when it is forced (cursor moved on or off it, physical screen
 * cleared) or when it blinks.
 *
 * Not synchronized: callers that share one screen between threads wrap it
 * (see ScreenMirror).
 */
class LogicalScreen : public IScreen {
public:
    LogicalScreen();
    LogicalScreen(int width, int height);
    ~LogicalScreen() override;

    LogicalScreen(const LogicalScreen& other) = default;
    LogicalScreen& operator=(const LogicalScreen& other) = default;

    void SetOffsetX(int offsetX) override { m_offsetX = offsetX; }
    void SetOffsetY(int offsetY) override { m_offsetY = offsetY; }
    int GetOffsetX() const { return m_offsetX; }
    int GetOffsetY() const { return m_offsetY; }

    int GetClipRight() const override { return m_clipRight; }
    void SetClipRight(int clipRight) override { m_clipRight = clipRight; }
    int GetClipBottom() const override { return m_clipBottom; }
    void SetClipBottom(int clipBottom) override { m_clipBottom = clipBottom; }
    int GetClipLeft() const override { return m_clipLeft; }
    void SetClipLeft(int clipLeft) override { m_clipLeft = clipLeft; }
    int GetClipTop() const override { return m_clipTop; }
    void SetClipTop(int clipTop) override { m_clipTop = clipTop; }

    bool IsDirty() const override;
    bool NeedsFullRedraw() const override { return m_reallyCleared; }

    // Per-cell view of the dirty state, for backends emitting changes
    bool IsCellDirty(int x, int y) const;
    std::vector<CellPosition> GetDirtyCells() const;
    Cell GetPhysicalCell(int x, int y) const;

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
    void SetDimensions(int width, int height) override;
    int GetWidth() const override { return m_width; }
    int GetHeight() const override { return m_height; }

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

    // Box in the screen's own border style
    void DrawFrame(int left, int top, int right, int bottom,
                   const CellAttributes& border, const CellAttributes& background,
                   bool shadow = false);
    void SetBorderStyle(const BorderStyle& borderStyle) { m_borderStyle = borderStyle; }
    const BorderStyle& GetBorderStyle() const { return m_borderStyle; }

    void ClearPhysical() override;
    void UnsetImageRow(int y) override;

    // Base implementation syncs physical to logical; backends override to
    // emit the dirty cells first and then call this.
    void FlushPhysical() override;

    void PutCursor(bool visible, int x, int y) override;
    void HideCursor() override;
    bool IsCursorVisible() const override { return m_cursorVisible; }
    int GetCursorX() const override { return m_cursorX; }
    int GetCursorY() const override { return m_cursorY; }

    void SetTitle(const std::string& title) override { m_title = title; }
    std::string GetTitle() const override { return m_title; }
    int GetTextWidth() const override { return m_textWidth; }
    int GetTextHeight() const override { return m_textHeight; }
    void SetTextCellSize(int textWidth, int textHeight);

    void InvertCell(int x, int y, bool onlyThisCell = false) override;
    void SetSelection(int x0, int y0, int x1, int y1, bool rectangle) override;
    std::string CopySelection(int x0, int y0, int x1, int y1, bool rectangle) const override;

    std::unique_ptr<IScreen> Snapshot() const override;

protected:
    int CellIndex(int x, int y) const { return y * m_width + x; }
    bool InGrid(int x, int y) const { return x >= 0 && x < m_width && y >= 0 && y < m_height; }

    // Force the physical copy of (x, y) to be treated as stale
    void InvalidateCell(int x, int y);

private:
    void Reallocate(int width, int height);

    // Clip test on the untranslated point, then offset; false if dropped
    bool Translate(int x, int y, int& outX, int& outY) const;
    void OnCellWritten(int x, int y);

    template<typename Visitor>
    void ForEachSelected(int x0, int y0, int x1, int y1, bool rectangle, Visitor&& visit) const;

    int m_width;
    int m_height;
    BorderStyle m_borderStyle;

    int m_offsetX;
    int m_offsetY;
    int m_clipLeft;
    int m_clipTop;
    int m_clipRight;
    int m_clipBottom;

    std::vector<Cell> m_logical;          // What should be shown
    std::vector<Cell> m_physical;         // What was last flushed
    std::vector<uint8_t> m_forceRedraw;   // Physical cells known to be stale

    // Set on reallocation; the next flush must redraw everything
    bool m_reallyCleared;

    bool m_cursorVisible;
    int m_cursorX;
    int m_cursorY;

    std::string m_title;
    int m_textWidth;
    int m_textHeight;
};

} // namespace TermCanvas::Terminal
