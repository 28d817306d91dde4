#include <cavern/simulation.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

namespace cavern {

const char* modeName(Mode mode) noexcept {
    switch (mode) {
        case Mode::Paint:     return "paint";
        case Mode::Life:      return "life";
        case Mode::DrunkWalk: return "drunk";
    }
    return "unknown";
}

Result<Mode> parseMode(std::string_view name) {
    if (name == "paint" || name == "1") return Ok(Mode::Paint);
    if (name == "life" || name == "2") return Ok(Mode::Life);
    if (name == "drunk" || name == "drunk-walk" || name == "3") return Ok(Mode::DrunkWalk);
    return Err<Mode>("unknown mode '" + std::string(name) + "' (expected paint, life or drunk)");
}

Result<InitialMap> parseInitialMap(std::string_view name) {
    if (name == "empty") return Ok(InitialMap::Empty);
    if (name == "random") return Ok(InitialMap::Random);
    if (name == "drunk") return Ok(InitialMap::Drunk);
    return Err<InitialMap>("unknown initial map '" + std::string(name) +
                           "' (expected empty, random or drunk)");
}

Simulation::Simulation(const SimulationConfig& config, Clock::time_point now)
    : _config(config),
      _grid(config.worldWidth, config.worldHeight),
      _camera(config.worldWidth, config.worldHeight),
      _mode(config.mode),
      _seed(config.seed),
      _lastStep(now) {
    switch (_config.initial) {
        case InitialMap::Empty:
            break;
        case InitialMap::Random:
            gen::regenRandom(_grid, _seed, _config.fillProbability);
            break;
        case InitialMap::Drunk:
            gen::genDrunkWalk(_grid, _seed, _config.drunkRatio);
            break;
    }
    _cursor = {static_cast<int32_t>(_grid.width() / 2), static_cast<int32_t>(_grid.height() / 2)};
    spdlog::info("Simulation: world {}x{} mode={} seed={}",
                 _grid.width(), _grid.height(), modeName(_mode), _seed);
}

bool Simulation::apply(Command cmd, Clock::time_point now) {
    switch (cmd) {
        case Command::MoveLeft:          moveCursor(-1, 0); break;
        case Command::MoveRight:         moveCursor(1, 0); break;
        case Command::MoveUp:            moveCursor(0, -1); break;
        case Command::MoveDown:          moveCursor(0, 1); break;
        case Command::ToggleCell:        toggleCell(); break;
        case Command::Clear:             clearGrid(); break;
        case Command::Regenerate:        regenerate(); break;
        case Command::RegenerateNewSeed: regenerateNewSeed(); break;
        case Command::ToggleRun:         toggleRunning(now); break;
        case Command::SingleStep:        singleStep(); break;
        case Command::ModePaint:         setMode(Mode::Paint, now); break;
        case Command::ModeLife:          setMode(Mode::Life, now); break;
        case Command::ModeDrunkWalk:     setMode(Mode::DrunkWalk, now); break;
        case Command::Quit:              requestQuit(); break;
        case Command::None:              return false;
    }
    return true;
}

void Simulation::moveCursor(int32_t dx, int32_t dy) noexcept {
    const int64_t maxX = std::max<int64_t>(0, int64_t{_grid.width()} - 1);
    const int64_t maxY = std::max<int64_t>(0, int64_t{_grid.height()} - 1);
    _cursor.x = static_cast<int32_t>(std::clamp<int64_t>(int64_t{_cursor.x} + dx, 0, maxX));
    _cursor.y = static_cast<int32_t>(std::clamp<int64_t>(int64_t{_cursor.y} + dy, 0, maxY));
    _camera.followCursor(_cursor);
    _viewDirty = true;
}

void Simulation::toggleCell() noexcept {
    _grid.toggle(_cursor.x, _cursor.y);
}

void Simulation::clearGrid() noexcept {
    _grid.clear();
}

void Simulation::regenerate() {
    if (_mode == Mode::DrunkWalk) {
        gen::genDrunkWalk(_grid, _seed, _config.drunkRatio);
    } else {
        gen::regenRandom(_grid, _seed, _config.fillProbability);
    }
    spdlog::debug("Simulation::regenerate: mode={} seed={}", modeName(_mode), _seed);
}

void Simulation::regenerateNewSeed() {
    ++_seed;
    _viewDirty = true;
    regenerate();
}

void Simulation::toggleRunning(Clock::time_point now) noexcept {
    setRunning(!_running, now);
}

void Simulation::setRunning(bool running, Clock::time_point now) noexcept {
    if (running && !_running) {
        _lastStep = now;
    }
    if (running != _running) {
        _viewDirty = true;
    }
    _running = running;
}

void Simulation::singleStep() {
    stepActive();
}

void Simulation::setMode(Mode mode, Clock::time_point now) {
    if (mode == Mode::Life || mode == Mode::DrunkWalk) {
        _running = false;
        _lastStep = now;
    }
    if (mode != _mode) {
        spdlog::debug("Simulation: mode {} -> {}", modeName(_mode), modeName(mode));
    }
    _mode = mode;
    _viewDirty = true;
}

void Simulation::resizeView(uint32_t viewWidth, uint32_t viewHeight) noexcept {
    _camera.setViewSize(viewWidth, viewHeight);
    _camera.followCursor(_cursor);
    _viewDirty = true;
}

bool Simulation::tick(Clock::time_point now) {
    if (!stepsAutomatically()) return false;
    if (now - _lastStep < _config.tickInterval) return false;
    _lastStep = now;
    stepActive();
    return true;
}

Simulation::Clock::duration Simulation::untilNextStep(Clock::time_point now) const noexcept {
    if (!stepsAutomatically()) return _config.tickInterval;
    auto due = _lastStep + _config.tickInterval;
    if (now >= due) return Clock::duration::zero();
    return due - now;
}

void Simulation::stepActive() {
    switch (_mode) {
        case Mode::Paint:
            return;
        case Mode::Life:
            _grid.stepLife();
            break;
        case Mode::DrunkWalk:
            ++_seed;
            gen::genDrunkWalk(_grid, _seed, _config.drunkRatio);
            recenterCursor();
            break;
    }
    ++_steps;
    _viewDirty = true;
}

bool Simulation::needsRedraw() const noexcept {
    return _viewDirty || _grid.isDirty();
}

void Simulation::markDrawn() noexcept {
    _viewDirty = false;
    _grid.clearDirty();
}

void Simulation::recenterCursor() noexcept {
    _cursor = {static_cast<int32_t>(_grid.width() / 2), static_cast<int32_t>(_grid.height() / 2)};
    _camera.centerOn(_cursor);
    _camera.followCursor(_cursor);
}

} // namespace cavern
