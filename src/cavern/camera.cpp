#include <cavern/camera.h>

#include <algorithm>
#include <limits>

namespace cavern {

Camera::Camera(uint32_t worldWidth, uint32_t worldHeight) noexcept
    : _worldWidth(worldWidth), _worldHeight(worldHeight) {}

void Camera::setViewSize(uint32_t viewWidth, uint32_t viewHeight) noexcept {
    _viewWidth = std::min(viewWidth, _worldWidth);
    _viewHeight = std::min(viewHeight, _worldHeight);
    _origin.x = clampAxis(_origin.x, _viewWidth, _worldWidth);
    _origin.y = clampAxis(_origin.y, _viewHeight, _worldHeight);
}

void Camera::followCursor(Point cursor) noexcept {
    if (!hasView()) return;

    _origin.x = clampAxis(followAxis(_origin.x, cursor.x, _viewWidth), _viewWidth, _worldWidth);
    _origin.y = clampAxis(followAxis(_origin.y, cursor.y, _viewHeight), _viewHeight, _worldHeight);
}

void Camera::centerOn(Point p) noexcept {
    _origin.x = clampAxis(int64_t{p.x} - _viewWidth / 2, _viewWidth, _worldWidth);
    _origin.y = clampAxis(int64_t{p.y} - _viewHeight / 2, _viewHeight, _worldHeight);
}

bool Camera::contains(Point p) const noexcept {
    return p.x >= _origin.x && p.y >= _origin.y &&
           int64_t{p.x} < int64_t{_origin.x} + _viewWidth &&
           int64_t{p.y} < int64_t{_origin.y} + _viewHeight;
}

int64_t Camera::followAxis(int32_t origin, int32_t cursor, uint32_t view) noexcept {
    const int64_t size = view;
    if (cursor < origin) return cursor;
    if (cursor >= origin + size) return int64_t{cursor} + 1 - size;
    return origin;
}

int32_t Camera::clampAxis(int64_t origin, uint32_t view, uint32_t world) noexcept {
    if (view >= world) return 0;
    const int64_t maxOrigin = std::min<int64_t>(int64_t{world} - view, std::numeric_limits<int32_t>::max());
    return static_cast<int32_t>(std::clamp<int64_t>(origin, 0, maxOrigin));
}

} // namespace cavern
