#pragma once

//=============================================================================
// Grid
//
// Fixed-size boolean world map. A set cell is a wall (drawn filled), a
// cleared cell is open floor.
//
// Out-of-bounds contract: coordinates are arbitrary integers. Reads outside
// [0, width) x [0, height) return std::nullopt, writes outside it are
// silently ignored. Nothing wraps. Camera clamping and the drunk-walk
// carver rely on this, so it must not be turned into an error path.
//=============================================================================

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace cavern {

class Grid {
public:
    Grid(uint32_t width, uint32_t height);

    uint32_t width() const noexcept { return _width; }
    uint32_t height() const noexcept { return _height; }

    bool inBounds(int32_t x, int32_t y) const noexcept {
        return x >= 0 && y >= 0 &&
               static_cast<uint32_t>(x) < _width &&
               static_cast<uint32_t>(y) < _height;
    }

    std::optional<bool> get(int32_t x, int32_t y) const noexcept;
    void set(int32_t x, int32_t y, bool value) noexcept;
    void toggle(int32_t x, int32_t y) noexcept;

    void fill(bool value) noexcept;
    void clear() noexcept { fill(false); }

    // Advance one Conway's Life generation (B3/S23) with non-wrapping edges.
    // The next generation is computed into the back buffer from the front
    // buffer, then the two are swapped.
    void stepLife() noexcept;

    // Alive cells among the up-to-8 in-bounds neighbors of (x, y);
    // 0 for a position outside the grid.
    int countNeighbors(int32_t x, int32_t y) const noexcept;
    size_t countFilled() const noexcept;

    // Number of Life steps applied since construction
    uint64_t generation() const noexcept { return _generation; }

    bool isDirty() const noexcept { return _dirty; }
    void clearDirty() noexcept { _dirty = false; }

private:
    size_t cellIndex(int32_t x, int32_t y) const noexcept {
        return static_cast<size_t>(y) * _width + static_cast<size_t>(x);
    }

    uint32_t _width;
    uint32_t _height;

    // Front buffer is the current generation, back buffer is scratch
    std::vector<uint8_t> _cells;
    std::vector<uint8_t> _scratch;

    uint64_t _generation = 0;
    bool _dirty = true;
};

} // namespace cavern
