#pragma once

//=============================================================================
// App
//
// Terminal host for the simulation. Puts the tty in raw mode, then loops:
// wait for input with a bounded poll() timeout, dispatch decoded commands,
// step the simulation when its tick interval has elapsed, redraw.
//=============================================================================

#include <cavern/config.h>
#include <cavern/keymap.h>
#include <cavern/result.hpp>
#include <cavern/simulation.h>
#include <cavern/terminal-renderer.h>

#include <cstdint>
#include <memory>
#include <string>

namespace cavern {

class App {
public:
    using Ptr = std::shared_ptr<App>;

    static Result<Ptr> create(Config::Ptr config) noexcept;

    ~App() = default;

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    // Interactive loop on stdin/stdout; returns when the user quits
    Result<void> run();

    // Advance the active mode `steps` times without a terminal and return
    // the world as text
    Result<std::string> runHeadless(uint64_t steps);

    Simulation& simulation() noexcept { return *_sim; }
    const KeyMap& keyMap() const noexcept { return _keyMap; }

    // Build the simulation settings from config, validating every value
    static Result<SimulationConfig> simulationConfigFrom(const Config& config);

private:
    explicit App(Config::Ptr config) noexcept;
    Result<void> init() noexcept;

    Result<void> applyKeyBindings();
    Result<void> updateTerminalSize();
    Result<void> draw();
    Result<void> processInput();

    static Result<void> writeAll(const std::string& data);

    Config::Ptr _config;
    std::unique_ptr<Simulation> _sim;
    KeyMap _keyMap;
    TerminalRenderer _renderer;

    uint32_t _cols = 80;
    uint32_t _rows = 24;
};

} // namespace cavern
