#include <cavern/grid.h>

#include <algorithm>

namespace cavern {

Grid::Grid(uint32_t width, uint32_t height)
    : _width(width), _height(height),
      _cells(static_cast<size_t>(width) * height, 0),
      _scratch(static_cast<size_t>(width) * height, 0) {}

std::optional<bool> Grid::get(int32_t x, int32_t y) const noexcept {
    if (!inBounds(x, y)) return std::nullopt;
    return _cells[cellIndex(x, y)] != 0;
}

void Grid::set(int32_t x, int32_t y, bool value) noexcept {
    if (!inBounds(x, y)) return;
    _cells[cellIndex(x, y)] = value ? 1 : 0;
    _dirty = true;
}

void Grid::toggle(int32_t x, int32_t y) noexcept {
    if (!inBounds(x, y)) return;
    auto& cell = _cells[cellIndex(x, y)];
    cell = cell ? 0 : 1;
    _dirty = true;
}

void Grid::fill(bool value) noexcept {
    std::fill(_cells.begin(), _cells.end(), value ? 1 : 0);
    _dirty = true;
}

int Grid::countNeighbors(int32_t x, int32_t y) const noexcept {
    if (!inBounds(x, y)) return 0;

    int count = 0;
    for (int32_t dy = -1; dy <= 1; ++dy) {
        for (int32_t dx = -1; dx <= 1; ++dx) {
            if (dx == 0 && dy == 0) continue;
            int32_t nx = x + dx;
            int32_t ny = y + dy;
            if (!inBounds(nx, ny)) continue;  // beyond the edge counts as dead
            count += _cells[cellIndex(nx, ny)];
        }
    }
    return count;
}

size_t Grid::countFilled() const noexcept {
    return static_cast<size_t>(std::count(_cells.begin(), _cells.end(), uint8_t{1}));
}

void Grid::stepLife() noexcept {
    const int32_t w = static_cast<int32_t>(_width);
    const int32_t h = static_cast<int32_t>(_height);

    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            int n = countNeighbors(x, y);
            bool alive = _cells[cellIndex(x, y)] != 0;
            bool next = alive ? (n == 2 || n == 3) : (n == 3);
            _scratch[cellIndex(x, y)] = next ? 1 : 0;
        }
    }

    _cells.swap(_scratch);
    ++_generation;
    _dirty = true;
}

} // namespace cavern
