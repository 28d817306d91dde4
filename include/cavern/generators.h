#pragma once

//=============================================================================
// Map generators
//
// Both generators reseed a std::mt19937_64 from the given seed on every
// call, so the same seed, dimensions and parameters always reproduce the
// same map.
//=============================================================================

#include <cavern/grid.h>

#include <cstddef>
#include <cstdint>

namespace cavern::gen {

static constexpr double DEFAULT_FILL_PROBABILITY = 0.45;
static constexpr double DEFAULT_DRUNK_RATIO = 0.4;

// Clear the grid, wall off the outer border and make every interior cell a
// wall with independent probability p (clamped to [0, 1]).
void regenRandom(Grid& grid, uint64_t seed, double p = DEFAULT_FILL_PROBABILITY);

// Number of cells genDrunkWalk() will carve for this grid and ratio:
// round(w * h * ratio), capped at the interior cell count (w-2)*(h-2).
size_t drunkWalkTarget(const Grid& grid, double ratio);

// Fill the grid with wall and carve open floor with a random walk from the
// center. The 1-cell border is never carved. Returns the number of cells
// opened, which is drunkWalkTarget(grid, ratio).
size_t genDrunkWalk(Grid& grid, uint64_t seed, double ratio = DEFAULT_DRUNK_RATIO);

} // namespace cavern::gen
