#include <cavern/keymap.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace cavern {

namespace {

constexpr char ESC = '\033';

constexpr Command ALL_COMMANDS[] = {
    Command::MoveLeft, Command::MoveRight, Command::MoveUp, Command::MoveDown,
    Command::ToggleCell, Command::Clear, Command::Regenerate, Command::RegenerateNewSeed,
    Command::ToggleRun, Command::SingleStep, Command::ModePaint, Command::ModeLife,
    Command::ModeDrunkWalk, Command::Quit,
};

std::string toLower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

Key arrowKey(char final) {
    switch (final) {
        case 'A': return KEY_UP;
        case 'B': return KEY_DOWN;
        case 'C': return KEY_RIGHT;
        case 'D': return KEY_LEFT;
        default:  return 0;
    }
}

} // namespace

KeyMap::KeyMap() {
    bind(KEY_LEFT, Command::MoveLeft);
    bind(KEY_RIGHT, Command::MoveRight);
    bind(KEY_UP, Command::MoveUp);
    bind(KEY_DOWN, Command::MoveDown);
    bind('h', Command::MoveLeft);
    bind('l', Command::MoveRight);
    bind('k', Command::MoveUp);
    bind('j', Command::MoveDown);

    bind(' ', Command::ToggleCell);
    bind('c', Command::Clear);
    bind('r', Command::Regenerate);
    bind('n', Command::RegenerateNewSeed);
    bind('p', Command::ToggleRun);
    bind(KEY_ENTER, Command::ToggleRun);
    bind('\n', Command::ToggleRun);
    bind('s', Command::SingleStep);

    bind('1', Command::ModePaint);
    bind('2', Command::ModeLife);
    bind('3', Command::ModeDrunkWalk);

    bind('q', Command::Quit);
    bind(KEY_CTRL_C, Command::Quit);
}

void KeyMap::bind(Key key, Command cmd) {
    if (cmd == Command::None) {
        unbind(key);
        return;
    }
    _bindings[key] = cmd;
}

void KeyMap::unbind(Key key) {
    _bindings.erase(key);
}

Command KeyMap::lookup(Key key) const {
    auto it = _bindings.find(key);
    return it == _bindings.end() ? Command::None : it->second;
}

Result<void> KeyMap::bind(std::string_view keyName, std::string_view commandName) {
    auto key = parseKey(keyName);
    if (!key) {
        return Err<void>("Invalid key binding", key);
    }
    auto cmd = parseCommand(commandName);
    if (!cmd) {
        return Err<void>("Invalid key binding", cmd);
    }
    bind(*key, *cmd);
    spdlog::debug("KeyMap: bound '{}' to {}", keyName, cavern::commandName(*cmd));
    return Ok();
}

Result<Key> KeyMap::parseKey(std::string_view name) {
    if (name.size() == 1) {
        return Ok(static_cast<Key>(static_cast<unsigned char>(name[0])));
    }
    auto lower = toLower(name);
    if (lower == "left") return Ok(KEY_LEFT);
    if (lower == "right") return Ok(KEY_RIGHT);
    if (lower == "up") return Ok(KEY_UP);
    if (lower == "down") return Ok(KEY_DOWN);
    if (lower == "space") return Ok(static_cast<Key>(' '));
    if (lower == "enter" || lower == "return") return Ok(KEY_ENTER);
    if (lower == "tab") return Ok(static_cast<Key>('\t'));
    if (lower.size() == 6 && lower.starts_with("ctrl-") && std::isalpha(static_cast<unsigned char>(lower[5]))) {
        return Ok(static_cast<Key>(lower[5] - 'a' + 1));
    }
    return Err<Key>("unknown key name '" + std::string(name) + "'");
}

Result<Command> KeyMap::parseCommand(std::string_view name) {
    auto lower = toLower(name);
    if (lower == "none") return Ok(Command::None);
    for (Command cmd : ALL_COMMANDS) {
        if (lower == commandName(cmd)) return Ok(cmd);
    }
    return Err<Command>("unknown command '" + std::string(name) + "'");
}

std::vector<Command> KeyMap::feed(const char* data, size_t len) {
    std::string buf = std::move(_pending);
    _pending.clear();
    buf.append(data, len);

    std::vector<Command> out;
    auto emit = [&](Key key) {
        Command cmd = lookup(key);
        if (cmd != Command::None) out.push_back(cmd);
    };

    const size_t n = buf.size();
    size_t i = 0;
    while (i < n) {
        char c = buf[i];
        if (c != ESC) {
            emit(static_cast<Key>(static_cast<unsigned char>(c)));
            ++i;
            continue;
        }

        if (i + 1 >= n) {
            _pending = buf.substr(i);
            break;
        }

        char intro = buf[i + 1];
        if (intro == 'O') {
            // SS3: ESC O <final>
            if (i + 2 >= n) {
                _pending = buf.substr(i);
                break;
            }
            if (Key key = arrowKey(buf[i + 2])) emit(key);
            i += 3;
            continue;
        }
        if (intro != '[') {
            // Not a sequence we know; drop the ESC and read on
            ++i;
            continue;
        }

        // CSI: ESC [ <params 0x30-0x3F>* <intermediates 0x20-0x2F>* <final 0x40-0x7E>
        size_t j = i + 2;
        while (j < n && buf[j] >= 0x20 && buf[j] <= 0x3F) ++j;
        if (j >= n) {
            _pending = buf.substr(i);
            break;
        }
        bool bare = (j == i + 2);
        if (bare) {
            if (Key key = arrowKey(buf[j])) emit(key);
        }
        i = j + 1;
    }
    return out;
}

} // namespace cavern
