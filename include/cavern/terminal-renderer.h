#pragma once

//=============================================================================
// TerminalRenderer
//
// Builds full-screen frames as ANSI escape strings. Layout, top to bottom:
//
//   status line   mode, seed, run state, cursor, sizes, step counter
//   ┏━ Cave! ━┓   thick border around the viewport
//   ┃██  ██   ┃   one world cell = two terminal columns, one row
//   ┗━━━━━━━━━┛
//   help line
//
// The renderer only reads simulation state.
//=============================================================================

#include <cavern/simulation.h>

#include <cstdint>
#include <string>

namespace cavern {

struct ViewSize {
    uint32_t width = 0;
    uint32_t height = 0;
};

class TerminalRenderer {
public:
    // Terminal rows used by everything except viewport cells
    static constexpr uint32_t CHROME_ROWS = 4;
    static constexpr uint32_t CHROME_COLS = 2;
    static constexpr uint32_t CELL_COLS = 2;

    // Viewport in world cells that fits a terminal of cols x rows
    static ViewSize viewSizeFor(uint32_t cols, uint32_t rows) noexcept;

    std::string renderFrame(const Simulation& sim, uint32_t cols, uint32_t rows) const;

    static std::string statusLine(const Simulation& sim);
    static std::string helpLine();

    // Alternate screen + hidden cursor, and the reverse
    static std::string enterScreen();
    static std::string leaveScreen();

    // Plain text dump of the whole world ('#' wall, '.' floor), one row per line
    static std::string dumpWorld(const Grid& grid);
};

} // namespace cavern
