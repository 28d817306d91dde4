//=============================================================================
// Grid Unit Tests
//
// Covers: bounds contract, toggle/set/fill, Life step with non-wrapping
// edges, double-buffered generation swap
//=============================================================================

#include <boost/ut.hpp>
#include <cavern/grid.h>

#include <climits>
#include <utility>
#include <vector>

using namespace boost::ut;
using namespace cavern;

namespace {

std::vector<std::pair<int, int>> aliveCells(const Grid& g) {
    std::vector<std::pair<int, int>> out;
    for (int y = 0; y < static_cast<int>(g.height()); ++y) {
        for (int x = 0; x < static_cast<int>(g.width()); ++x) {
            if (g.get(x, y).value_or(false)) out.emplace_back(x, y);
        }
    }
    return out;
}

void setBlock(Grid& g, int x0, int y0, int w, int h) {
    for (int y = y0; y < y0 + h; ++y) {
        for (int x = x0; x < x0 + w; ++x) {
            g.set(x, y, true);
        }
    }
}

} // namespace

suite grid_tests = [] {
    //=========================================================================
    // Construction and access
    //=========================================================================

    "new grid is empty with requested size"_test = [] {
        Grid g(12, 7);
        expect(g.width() == 12_u);
        expect(g.height() == 7_u);
        expect(g.countFilled() == 0_ul);
        expect(g.get(0, 0) == std::optional<bool>(false));
        expect(g.get(11, 6) == std::optional<bool>(false));
    };

    "get outside the grid is absent"_test = [] {
        Grid g(5, 4);
        g.fill(true);
        expect(!g.get(-1, 0).has_value());
        expect(!g.get(0, -1).has_value());
        expect(!g.get(5, 0).has_value()) << "x == width is out of bounds";
        expect(!g.get(0, 4).has_value()) << "y == height is out of bounds";
        expect(!g.get(INT_MAX, INT_MAX).has_value());
        expect(!g.get(INT_MIN, 2).has_value());
    };

    "set and toggle outside the grid change nothing"_test = [] {
        Grid g(6, 6);
        g.set(2, 3, true);
        auto before = aliveCells(g);

        for (auto [x, y] : std::vector<std::pair<int, int>>{
                 {-1, 0}, {0, -1}, {6, 0}, {0, 6}, {-7, -7}, {INT_MAX, 0}, {0, INT_MIN}}) {
            g.set(x, y, true);
            g.toggle(x, y);
        }

        expect(aliveCells(g) == before);
    };

    "edges never wrap"_test = [] {
        Grid g(4, 4);
        g.set(3, 0, true);
        expect(g.get(-1, 0) != std::optional<bool>(true)) << "x=-1 must not alias x=3";
        expect(g.countNeighbors(0, 0) == 0_i) << "right edge is not adjacent to left edge";
    };

    "toggle flips a cell"_test = [] {
        Grid g(3, 3);
        g.toggle(1, 2);
        expect(g.get(1, 2) == std::optional<bool>(true));
        g.toggle(1, 2);
        expect(g.get(1, 2) == std::optional<bool>(false));
    };

    "fill and clear cover every cell"_test = [] {
        Grid g(9, 5);
        g.fill(true);
        expect(g.countFilled() == 45_ul);
        g.clear();
        expect(g.countFilled() == 0_ul);
    };

    "mutations mark the grid dirty"_test = [] {
        Grid g(3, 3);
        g.clearDirty();
        expect(!g.isDirty());
        g.toggle(1, 1);
        expect(g.isDirty());
        g.clearDirty();
        g.toggle(-1, 1);
        expect(!g.isDirty()) << "ignored writes leave the dirty flag alone";
    };

    //=========================================================================
    // Neighbor counting
    //=========================================================================

    "corner and edge cells have fewer neighbors"_test = [] {
        Grid g(5, 5);
        g.fill(true);
        expect(g.countNeighbors(0, 0) == 3_i);
        expect(g.countNeighbors(4, 4) == 3_i);
        expect(g.countNeighbors(2, 0) == 5_i);
        expect(g.countNeighbors(0, 2) == 5_i);
        expect(g.countNeighbors(2, 2) == 8_i);
    };

    //=========================================================================
    // Life step
    //=========================================================================

    "empty grid stays empty"_test = [] {
        Grid g(16, 10);
        g.stepLife();
        expect(g.countFilled() == 0_ul);
        expect(g.generation() == 1_ul);
    };

    "2x2 block is a still life"_test = [] {
        Grid g(6, 6);
        setBlock(g, 2, 2, 2, 2);
        auto before = aliveCells(g);
        g.stepLife();
        expect(aliveCells(g) == before);
    };

    "blinker oscillates with period 2"_test = [] {
        Grid g(5, 5);
        g.set(2, 1, true);
        g.set(2, 2, true);
        g.set(2, 3, true);

        g.stepLife();
        std::vector<std::pair<int, int>> horizontal = {{1, 2}, {2, 2}, {3, 2}};
        expect(aliveCells(g) == horizontal);

        g.stepLife();
        std::vector<std::pair<int, int>> vertical = {{2, 1}, {2, 2}, {2, 3}};
        expect(aliveCells(g) == vertical);
    };

    "3x3 block in open space evolves into a ring"_test = [] {
        Grid g(7, 7);
        setBlock(g, 2, 2, 3, 3);
        g.stepLife();

        // Corners survive with 3 neighbors, edge centers and the middle die,
        // and one cell is born beyond each side
        std::vector<std::pair<int, int>> expected = {
            {3, 1},
            {2, 2}, {4, 2},
            {1, 3}, {5, 3},
            {2, 4}, {4, 4},
            {3, 5},
        };
        expect(aliveCells(g) == expected);
    };

    "3x3 block in a corner only counts in-bounds neighbors"_test = [] {
        Grid g(5, 5);
        setBlock(g, 0, 0, 3, 3);
        g.stepLife();

        std::vector<std::pair<int, int>> expected = {
            {0, 0}, {2, 0},
            {3, 1},
            {0, 2}, {2, 2},
            {1, 3},
        };
        expect(aliveCells(g) == expected);

        // On a torus these would be born from the block wrapping around
        expect(g.get(4, 1) == std::optional<bool>(false));
        expect(g.get(1, 4) == std::optional<bool>(false));
    };

    "all cells are evaluated against the same generation"_test = [] {
        // A glider: in-place updates would corrupt it within one step
        Grid g(8, 8);
        g.set(1, 0, true);
        g.set(2, 1, true);
        g.set(0, 2, true);
        g.set(1, 2, true);
        g.set(2, 2, true);

        for (int i = 0; i < 4; ++i) g.stepLife();

        // After 4 generations the glider has moved one cell down-right
        std::vector<std::pair<int, int>> expected = {
            {2, 1}, {3, 2}, {1, 3}, {2, 3}, {3, 3},
        };
        expect(aliveCells(g) == expected);
        expect(g.generation() == 4_ul);
    };

    "neighbor count outside the grid is zero"_test = [] {
        Grid g(4, 4);
        g.fill(true);
        expect(g.countNeighbors(INT_MAX, INT_MAX) == 0_i);
        expect(g.countNeighbors(INT_MIN, INT_MIN) == 0_i);
        expect(g.countNeighbors(-1, 0) == 0_i);
        expect(g.countNeighbors(4, 3) == 0_i);
    };
};
