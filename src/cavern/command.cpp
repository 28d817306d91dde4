#include <cavern/command.h>

namespace cavern {

const char* commandName(Command cmd) noexcept {
    switch (cmd) {
        case Command::None:              return "none";
        case Command::MoveLeft:          return "move-left";
        case Command::MoveRight:         return "move-right";
        case Command::MoveUp:            return "move-up";
        case Command::MoveDown:          return "move-down";
        case Command::ToggleCell:        return "toggle-cell";
        case Command::Clear:             return "clear";
        case Command::Regenerate:        return "regenerate";
        case Command::RegenerateNewSeed: return "new-seed";
        case Command::ToggleRun:         return "toggle-run";
        case Command::SingleStep:        return "step";
        case Command::ModePaint:         return "mode-paint";
        case Command::ModeLife:          return "mode-life";
        case Command::ModeDrunkWalk:     return "mode-drunk";
        case Command::Quit:              return "quit";
    }
    return "unknown";
}

} // namespace cavern
