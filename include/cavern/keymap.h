#pragma once

//=============================================================================
// KeyMap
//
// Decodes raw bytes read from a terminal in raw mode into Commands.
// Arrow keys arrive as CSI sequences (ESC [ A..D, or ESC O A..D in
// application cursor mode); everything else is a single byte. A sequence
// split across two reads is completed on the next feed().
//=============================================================================

#include <cavern/command.h>
#include <cavern/result.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cavern {

using Key = uint32_t;

// Keys that do not map to a single byte
static constexpr Key KEY_LEFT  = 0x100;
static constexpr Key KEY_RIGHT = 0x101;
static constexpr Key KEY_UP    = 0x102;
static constexpr Key KEY_DOWN  = 0x103;

static constexpr Key KEY_ENTER  = '\r';
static constexpr Key KEY_CTRL_C = 0x03;

class KeyMap {
public:
    // Default bindings: arrows and hjkl move, space toggles, c clears,
    // r regenerates, n new seed, p/Enter run, s step, 1/2/3 modes, q quits.
    KeyMap();

    void bind(Key key, Command cmd);
    void unbind(Key key);
    Command lookup(Key key) const;

    // Bind by names as written in the config file, e.g. ("space", "toggle-cell")
    Result<void> bind(std::string_view keyName, std::string_view commandName);

    // Decode bytes into commands; unbound keys are dropped.
    std::vector<Command> feed(const char* data, size_t len);
    std::vector<Command> feed(std::string_view data) { return feed(data.data(), data.size()); }

    // True while an escape sequence is incomplete
    bool pending() const noexcept { return !_pending.empty(); }

    static Result<Key> parseKey(std::string_view name);
    static Result<Command> parseCommand(std::string_view name);

private:
    std::unordered_map<Key, Command> _bindings;
    std::string _pending;
};

} // namespace cavern
