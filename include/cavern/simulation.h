#pragma once

//=============================================================================
// Simulation
//
// Owns the world Grid, the Camera and the cursor, and runs the mode state
// machine:
//
//   Paint      no autonomous evolution, only manual toggles
//   Life       each step applies Grid::stepLife()
//   DrunkWalk  each step bumps the seed and carves a fresh cave
//
// Entering Life or DrunkWalk pauses the simulation and resets the step
// timing reference. While running, tick() steps once per tick interval;
// singleStep() steps regardless of the running flag.
//=============================================================================

#include <cavern/camera.h>
#include <cavern/command.h>
#include <cavern/generators.h>
#include <cavern/grid.h>
#include <cavern/result.hpp>

#include <chrono>
#include <cstdint>
#include <string_view>

namespace cavern {

enum class Mode : uint8_t {
    Paint,
    Life,
    DrunkWalk,
};

const char* modeName(Mode mode) noexcept;
Result<Mode> parseMode(std::string_view name);

// Map built when the simulation starts
enum class InitialMap : uint8_t {
    Empty,
    Random,
    Drunk,
};

Result<InitialMap> parseInitialMap(std::string_view name);

struct SimulationConfig {
    // Largest world accepted from configuration
    static constexpr uint32_t MAX_WORLD_SIDE = 1u << 15;
    static constexpr uint64_t MAX_WORLD_CELLS = 1ull << 24;

    uint32_t worldWidth = 160;
    uint32_t worldHeight = 90;
    uint64_t seed = 1;
    Mode mode = Mode::Paint;
    InitialMap initial = InitialMap::Random;
    std::chrono::milliseconds tickInterval{50};
    double fillProbability = gen::DEFAULT_FILL_PROBABILITY;
    double drunkRatio = gen::DEFAULT_DRUNK_RATIO;
};

class Simulation {
public:
    using Clock = std::chrono::steady_clock;

    explicit Simulation(const SimulationConfig& config, Clock::time_point now = Clock::now());

    // Apply one input command. Returns false for Command::None.
    bool apply(Command cmd, Clock::time_point now = Clock::now());

    void moveCursor(int32_t dx, int32_t dy) noexcept;
    void toggleCell() noexcept;
    void clearGrid() noexcept;

    // Rebuild the map from the current seed with the generator of the
    // active mode (drunk walk in DrunkWalk, random fill otherwise).
    void regenerate();
    void regenerateNewSeed();

    void toggleRunning(Clock::time_point now) noexcept;
    void setRunning(bool running, Clock::time_point now) noexcept;
    void singleStep();
    void setMode(Mode mode, Clock::time_point now);
    void requestQuit() noexcept { _quit = true; }

    // Viewport size in cells, as derived from the rendering surface
    void resizeView(uint32_t viewWidth, uint32_t viewHeight) noexcept;

    // Step once if running outside Paint and a full tick interval has
    // elapsed since the last autonomous step. Returns true if a step happened.
    bool tick(Clock::time_point now);

    // Advance the grid by one step of the active mode
    void stepActive();

    // Time left until the next autonomous step, zero if one is due. A full
    // tick interval while nothing steps automatically (paused, or Paint).
    Clock::duration untilNextStep(Clock::time_point now) const noexcept;

    // Running in a mode that evolves on its own
    bool stepsAutomatically() const noexcept { return _running && _mode != Mode::Paint; }

    // True when the grid, cursor, camera or status changed since markDrawn()
    bool needsRedraw() const noexcept;
    void markDrawn() noexcept;

    const Grid& grid() const noexcept { return _grid; }
    Grid& grid() noexcept { return _grid; }
    const Camera& camera() const noexcept { return _camera; }
    Point cursor() const noexcept { return _cursor; }
    Mode mode() const noexcept { return _mode; }
    uint64_t seed() const noexcept { return _seed; }
    bool running() const noexcept { return _running; }
    bool quitRequested() const noexcept { return _quit; }
    uint64_t steps() const noexcept { return _steps; }
    std::chrono::milliseconds tickInterval() const noexcept { return _config.tickInterval; }
    Clock::time_point lastStep() const noexcept { return _lastStep; }
    const SimulationConfig& config() const noexcept { return _config; }

private:
    void recenterCursor() noexcept;

    SimulationConfig _config;
    Grid _grid;
    Camera _camera;
    Point _cursor;

    Mode _mode;
    uint64_t _seed;
    bool _running = false;
    bool _quit = false;
    bool _viewDirty = true;
    uint64_t _steps = 0;
    Clock::time_point _lastStep;
};

} // namespace cavern
