#pragma once

#include <cstdint>

namespace cavern {

// Discrete user intents delivered by the input adapter. Each maps to exactly
// one Simulation operation.
enum class Command : uint8_t {
    None = 0,
    MoveLeft,
    MoveRight,
    MoveUp,
    MoveDown,
    ToggleCell,
    Clear,
    Regenerate,
    RegenerateNewSeed,
    ToggleRun,
    SingleStep,
    ModePaint,
    ModeLife,
    ModeDrunkWalk,
    Quit,
};

const char* commandName(Command cmd) noexcept;

} // namespace cavern
