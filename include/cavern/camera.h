#pragma once

//=============================================================================
// Camera
//
// Maps a cursor in world space to the scrollable viewport shown on screen.
// The view size is clamped to the world size, and the origin always keeps
// the whole view inside the world:
//
//   0 <= originX <= worldW - viewW   (originX == 0 when viewW == worldW)
//=============================================================================

#include <cstdint>

namespace cavern {

struct Point {
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(const Point&) const = default;
};

struct Rect {
    int32_t x = 0;
    int32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;

    bool operator==(const Rect&) const = default;
};

class Camera {
public:
    Camera(uint32_t worldWidth, uint32_t worldHeight) noexcept;

    // Resize the viewport (clamped to the world) and re-clamp the origin.
    void setViewSize(uint32_t viewWidth, uint32_t viewHeight) noexcept;

    // Scroll the minimum amount needed to bring the cursor into view.
    // No-op while the view size is still zero.
    void followCursor(Point cursor) noexcept;

    // Put p in the middle of the view, then clamp.
    void centerOn(Point p) noexcept;

    Point origin() const noexcept { return _origin; }
    uint32_t viewWidth() const noexcept { return _viewWidth; }
    uint32_t viewHeight() const noexcept { return _viewHeight; }
    uint32_t worldWidth() const noexcept { return _worldWidth; }
    uint32_t worldHeight() const noexcept { return _worldHeight; }

    Rect visibleRect() const noexcept {
        return {_origin.x, _origin.y, _viewWidth, _viewHeight};
    }

    bool contains(Point p) const noexcept;
    bool hasView() const noexcept { return _viewWidth > 0 && _viewHeight > 0; }

private:
    // Axis math is done in 64 bits so any int32_t cursor is safe
    static int64_t followAxis(int32_t origin, int32_t cursor, uint32_t view) noexcept;
    static int32_t clampAxis(int64_t origin, uint32_t view, uint32_t world) noexcept;

    uint32_t _worldWidth;
    uint32_t _worldHeight;
    uint32_t _viewWidth = 0;
    uint32_t _viewHeight = 0;
    Point _origin;
};

} // namespace cavern
