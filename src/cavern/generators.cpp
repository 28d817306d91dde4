#include <cavern/generators.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <random>

namespace cavern::gen {

namespace {

struct Step {
    int32_t dx;
    int32_t dy;
};

constexpr Step DIRECTIONS[4] = {{0, -1}, {1, 0}, {0, 1}, {-1, 0}};

bool isBorder(const Grid& grid, uint32_t x, uint32_t y) {
    return x == 0 || y == 0 || x + 1 == grid.width() || y + 1 == grid.height();
}

size_t interiorCells(const Grid& grid) {
    if (grid.width() < 3 || grid.height() < 3) return 0;
    return static_cast<size_t>(grid.width() - 2) * (grid.height() - 2);
}

} // namespace

void regenRandom(Grid& grid, uint64_t seed, double p) {
    std::mt19937_64 rng(seed);
    std::bernoulli_distribution wall(std::clamp(p, 0.0, 1.0));

    grid.clear();
    for (uint32_t y = 0; y < grid.height(); ++y) {
        for (uint32_t x = 0; x < grid.width(); ++x) {
            bool filled = isBorder(grid, x, y) || wall(rng);
            grid.set(static_cast<int32_t>(x), static_cast<int32_t>(y), filled);
        }
    }
    spdlog::debug("regenRandom: {}x{} seed={} p={} filled={}",
                  grid.width(), grid.height(), seed, p, grid.countFilled());
}

size_t drunkWalkTarget(const Grid& grid, double ratio) {
    double cells = static_cast<double>(grid.width()) * grid.height();
    auto wanted = static_cast<size_t>(std::llround(cells * std::clamp(ratio, 0.0, 1.0)));
    return std::min(wanted, interiorCells(grid));
}

size_t genDrunkWalk(Grid& grid, uint64_t seed, double ratio) {
    grid.fill(true);

    const size_t target = drunkWalkTarget(grid, ratio);
    if (target == 0) {
        spdlog::debug("genDrunkWalk: nothing to carve on {}x{} ratio={}",
                      grid.width(), grid.height(), ratio);
        return 0;
    }

    // Interior bounds; target > 0 implies width and height are at least 3
    const int32_t minX = 1;
    const int32_t minY = 1;
    const int32_t maxX = static_cast<int32_t>(grid.width()) - 2;
    const int32_t maxY = static_cast<int32_t>(grid.height()) - 2;
    const int32_t lastX = static_cast<int32_t>(grid.width()) - 1;
    const int32_t lastY = static_cast<int32_t>(grid.height()) - 1;

    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> pick(0, 3);

    int32_t x = std::clamp(static_cast<int32_t>(grid.width() / 2), minX, maxX);
    int32_t y = std::clamp(static_cast<int32_t>(grid.height() / 2), minY, maxY);

    size_t opened = 0;
    uint64_t steps = 0;
    while (opened < target) {
        const Step& s = DIRECTIONS[pick(rng)];
        x = std::clamp(x + s.dx, 0, lastX);
        y = std::clamp(y + s.dy, 0, lastY);
        x = std::clamp(x, minX, maxX);
        y = std::clamp(y, minY, maxY);

        if (grid.get(x, y).value_or(false)) {
            grid.set(x, y, false);
            ++opened;
        }
        ++steps;
    }

    spdlog::debug("genDrunkWalk: {}x{} seed={} ratio={} opened={} steps={}",
                  grid.width(), grid.height(), seed, ratio, opened, steps);
    return opened;
}

} // namespace cavern::gen
