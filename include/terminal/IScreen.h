#pragma once

#include "terminal/BorderStyle.h"
#include "terminal/Cell.h"
#include <memory>
#include <string>

namespace TermCanvas::Terminal {

/**
 * @brief Drawing surface made of character cells
 *
 * Applications draw into the logical grid through this interface; a
 * backend compares it against what it last flushed and emits only the
 * changes. LogicalScreen is the grid-backed implementation, ScreenMirror
 * fans every call out to several screens.
 *
 * Writes outside the clip rectangle or the grid are dropped silently.
 */
class IScreen {
public:
    virtual ~IScreen() = default;

    // Drawing offset, added to coordinates after the clip test
    virtual void SetOffsetX(int offsetX) = 0;
    virtual void SetOffsetY(int offsetY) = 0;

    // Clip rectangle [left, right) x [top, bottom), in untranslated coordinates
    virtual int GetClipRight() const = 0;
    virtual void SetClipRight(int clipRight) = 0;
    virtual int GetClipBottom() const = 0;
    virtual void SetClipBottom(int clipBottom) = 0;
    virtual int GetClipLeft() const = 0;
    virtual void SetClipLeft(int clipLeft) = 0;
    virtual int GetClipTop() const = 0;
    virtual void SetClipTop(int clipTop) = 0;

    // Dirty tracking
    virtual bool IsDirty() const = 0;
    virtual bool NeedsFullRedraw() const = 0;

    // Cell access (absolute grid coordinates, no clip or offset)
    virtual CellAttributes GetAttrXY(int x, int y) const = 0;
    virtual Cell GetCharXY(int x, int y) const = 0;

    // Write operations
    virtual void PutAttrXY(int x, int y, const CellAttributes& attr, bool clip = true) = 0;
    virtual void PutAll(char32_t ch, const CellAttributes& attr) = 0;
    virtual void PutCharXY(int x, int y, const Cell& cell) = 0;
    virtual void PutCharXY(int x, int y, char32_t ch, const CellAttributes& attr) = 0;
    virtual void PutCharXY(int x, int y, char32_t ch) = 0;
    virtual void PutStringXY(int x, int y, const std::u32string& str, const CellAttributes& attr) = 0;
    virtual void PutStringXY(int x, int y, const std::u32string& str) = 0;
    virtual void VLineXY(int x, int y, int n, char32_t ch, const CellAttributes& attr) = 0;
    virtual void HLineXY(int x, int y, int n, char32_t ch, const CellAttributes& attr) = 0;

    // Size management (destructive)
    virtual void SetWidth(int width) = 0;
    virtual void SetHeight(int height) = 0;
    virtual void SetDimensions(int width, int height) = 0;
    virtual int GetWidth() const = 0;
    virtual int GetHeight() const = 0;

    // Clearing
    virtual void Reset() = 0;
    virtual void ResetClipping() = 0;
    virtual void Clear() = 0;

    // Boxes
    virtual void DrawBox(int left, int top, int right, int bottom,
                         const CellAttributes& border, const CellAttributes& background,
                         BoxStyle style = BoxStyle::Single, bool shadow = false) = 0;
    virtual void DrawBox(int left, int top, int right, int bottom,
                         const CellAttributes& border, const CellAttributes& background,
                         const BorderStyle& borderStyle, bool shadow) = 0;
    virtual void DrawBoxShadow(int left, int top, int right, int bottom) = 0;

    // Physical screen
    virtual void ClearPhysical() = 0;
    virtual void UnsetImageRow(int y) = 0;
    virtual void FlushPhysical() = 0;

    // Cursor
    virtual void PutCursor(bool visible, int x, int y) = 0;
    virtual void HideCursor() = 0;
    virtual bool IsCursorVisible() const = 0;
    virtual int GetCursorX() const = 0;
    virtual int GetCursorY() const = 0;

    // Session metadata
    virtual void SetTitle(const std::string& title) = 0;
    virtual std::string GetTitle() const = 0;
    virtual int GetTextWidth() const = 0;
    virtual int GetTextHeight() const = 0;

    // Selection
    virtual void InvertCell(int x, int y, bool onlyThisCell = false) = 0;
    virtual void SetSelection(int x0, int y0, int x1, int y1, bool rectangle) = 0;
    virtual std::string CopySelection(int x0, int y0, int x1, int y1, bool rectangle) const = 0;

    // Deep copy of the screen's data
    virtual std::unique_ptr<IScreen> Snapshot() const = 0;
};

} // namespace TermCanvas::Terminal
