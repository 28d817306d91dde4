#include <cavern/app.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <new>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace cavern {

namespace {

volatile std::sig_atomic_t g_resized = 0;

void onSigwinch(int) {
    g_resized = 1;
}

// Longest wait for input while paused
constexpr std::chrono::milliseconds IDLE_POLL_TIMEOUT{100};

// Raw mode, alternate screen and SIGWINCH handler for the lifetime of run()
class TerminalSession {
public:
    TerminalSession() = default;
    ~TerminalSession() { restore(); }

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

    Result<void> enter() {
        if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
            return Err<void>("stdin and stdout must be a terminal (use --headless otherwise)");
        }
        if (tcgetattr(STDIN_FILENO, &_saved) != 0) {
            return Err<void>(std::string("tcgetattr failed: ") + std::strerror(errno));
        }
        struct termios raw = _saved;
        cfmakeraw(&raw);
        if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
            return Err<void>(std::string("tcsetattr failed: ") + std::strerror(errno));
        }
        _rawActive = true;

        struct sigaction sa {};
        sa.sa_handler = onSigwinch;
        sigemptyset(&sa.sa_mask);
        if (sigaction(SIGWINCH, &sa, &_savedWinch) != 0) {
            return Err<void>(std::string("sigaction(SIGWINCH) failed: ") + std::strerror(errno));
        }
        _handlerActive = true;

        std::string enter = TerminalRenderer::enterScreen();
        if (::write(STDOUT_FILENO, enter.data(), enter.size()) < 0) {
            return Err<void>(std::string("write failed: ") + std::strerror(errno));
        }
        _screenActive = true;
        return Ok();
    }

    void restore() {
        if (_screenActive) {
            std::string leave = TerminalRenderer::leaveScreen();
            if (::write(STDOUT_FILENO, leave.data(), leave.size()) < 0) {
                spdlog::warn("TerminalSession: failed to leave alternate screen: {}", std::strerror(errno));
            }
            _screenActive = false;
        }
        if (_handlerActive) {
            sigaction(SIGWINCH, &_savedWinch, nullptr);
            _handlerActive = false;
        }
        if (_rawActive) {
            if (tcsetattr(STDIN_FILENO, TCSANOW, &_saved) != 0) {
                spdlog::warn("TerminalSession: failed to restore terminal: {}", std::strerror(errno));
            }
            _rawActive = false;
        }
    }

private:
    struct termios _saved {};
    struct sigaction _savedWinch {};
    bool _rawActive = false;
    bool _handlerActive = false;
    bool _screenActive = false;
};

} // namespace

//-----------------------------------------------------------------------------
// App
//-----------------------------------------------------------------------------

App::App(Config::Ptr config) noexcept
    : _config(std::move(config)) {}

Result<App::Ptr> App::create(Config::Ptr config) noexcept {
    if (!config) {
        return Err<Ptr>("App::create: null config");
    }
    auto app = Ptr(new App(std::move(config)));
    if (auto res = app->init(); !res) {
        return Err<Ptr>("Failed to init App", res);
    }
    return Ok(std::move(app));
}

Result<void> App::init() noexcept {
    auto simConfig = simulationConfigFrom(*_config);
    if (!simConfig) {
        return Err<void>("Invalid configuration", simConfig);
    }
    if (auto res = applyKeyBindings(); !res) {
        return res;
    }
    try {
        _sim = std::make_unique<Simulation>(*simConfig);
    } catch (const std::bad_alloc&) {
        return Err<void>("Out of memory allocating a " + std::to_string(simConfig->worldWidth) + "x" +
                         std::to_string(simConfig->worldHeight) + " world");
    }
    return Ok();
}

Result<SimulationConfig> App::simulationConfigFrom(const Config& config) {
    SimulationConfig out;

    auto width = config.value<uint32_t>(Config::KEY_WORLD_WIDTH);
    if (!width) return Err<SimulationConfig>("world width", width);
    auto height = config.value<uint32_t>(Config::KEY_WORLD_HEIGHT);
    if (!height) return Err<SimulationConfig>("world height", height);
    const std::string size = std::to_string(*width) + "x" + std::to_string(*height);
    if (*width == 0 || *height == 0) {
        return Err<SimulationConfig>("world size must be at least 1x1, got " + size);
    }
    if (*width > SimulationConfig::MAX_WORLD_SIDE || *height > SimulationConfig::MAX_WORLD_SIDE ||
        uint64_t{*width} * *height > SimulationConfig::MAX_WORLD_CELLS) {
        return Err<SimulationConfig>("world size " + size + " is too large (at most " +
                                     std::to_string(SimulationConfig::MAX_WORLD_SIDE) + " per side and " +
                                     std::to_string(SimulationConfig::MAX_WORLD_CELLS) + " cells)");
    }
    out.worldWidth = *width;
    out.worldHeight = *height;

    auto tickMs = config.value<uint32_t>(Config::KEY_SIM_TICK_MS);
    if (!tickMs) return Err<SimulationConfig>("tick interval", tickMs);
    if (*tickMs == 0) {
        return Err<SimulationConfig>("simulation/tick-ms must be positive");
    }
    out.tickInterval = std::chrono::milliseconds(*tickMs);

    auto seed = config.value<uint64_t>(Config::KEY_SIM_SEED);
    if (!seed) return Err<SimulationConfig>("seed", seed);
    out.seed = *seed;

    auto modeStr = config.value<std::string>(Config::KEY_SIM_MODE);
    if (!modeStr) return Err<SimulationConfig>("mode", modeStr);
    auto mode = parseMode(*modeStr);
    if (!mode) return Err<SimulationConfig>("mode", mode);
    out.mode = *mode;

    auto fill = config.value<double>(Config::KEY_GEN_FILL_PROBABILITY);
    if (!fill) return Err<SimulationConfig>("fill probability", fill);
    if (*fill < 0.0 || *fill > 1.0) {
        return Err<SimulationConfig>("generator/fill-probability must be within [0, 1]");
    }
    out.fillProbability = *fill;

    auto ratio = config.value<double>(Config::KEY_GEN_DRUNK_RATIO);
    if (!ratio) return Err<SimulationConfig>("drunk ratio", ratio);
    if (*ratio < 0.0 || *ratio > 1.0) {
        return Err<SimulationConfig>("generator/drunk-ratio must be within [0, 1]");
    }
    out.drunkRatio = *ratio;

    auto initialName = config.value<std::string>(Config::KEY_GEN_INITIAL);
    if (!initialName) return Err<SimulationConfig>("initial map", initialName);
    auto initial = parseInitialMap(*initialName);
    if (!initial) return Err<SimulationConfig>("initial map", initial);
    out.initial = *initial;

    return Ok(out);
}

Result<void> App::applyKeyBindings() {
    const YAML::Node& keys = _config->root()[Config::KEY_KEYS];
    if (!keys || keys.IsNull()) return Ok();
    if (!keys.IsMap()) {
        return Err<void>("keys must be a mapping of key name to command");
    }
    try {
        for (auto it = keys.begin(); it != keys.end(); ++it) {
            auto key = it->first.as<std::string>();
            auto command = it->second.as<std::string>();
            if (auto res = _keyMap.bind(key, command); !res) {
                return res;
            }
        }
    } catch (const YAML::Exception& e) {
        return Err<void>(std::string("keys: ") + e.what());
    }
    return Ok();
}

Result<void> App::updateTerminalSize() {
    struct winsize ws = {};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != 0) {
        return Err<void>(std::string("TIOCGWINSZ failed: ") + std::strerror(errno));
    }
    if (ws.ws_col > 0 && ws.ws_row > 0) {
        _cols = ws.ws_col;
        _rows = ws.ws_row;
    }
    auto view = TerminalRenderer::viewSizeFor(_cols, _rows);
    _sim->resizeView(view.width, view.height);
    spdlog::debug("App: terminal {}x{} -> view {}x{}", _cols, _rows,
                  _sim->camera().viewWidth(), _sim->camera().viewHeight());
    return Ok();
}

Result<void> App::writeAll(const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(STDOUT_FILENO, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Err<void>(std::string("write to terminal failed: ") + std::strerror(errno));
        }
        off += static_cast<size_t>(n);
    }
    return Ok();
}

Result<void> App::draw() {
    return writeAll(_renderer.renderFrame(*_sim, _cols, _rows));
}

Result<void> App::processInput() {
    char buf[256];
    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return Ok();
        return Err<void>(std::string("read from terminal failed: ") + std::strerror(errno));
    }
    if (n == 0) {
        spdlog::info("App: stdin closed");
        _sim->requestQuit();
        return Ok();
    }

    auto now = Simulation::Clock::now();
    for (Command cmd : _keyMap.feed(buf, static_cast<size_t>(n))) {
        spdlog::trace("App: command {}", commandName(cmd));
        _sim->apply(cmd, now);
        if (_sim->quitRequested()) break;
    }
    return Ok();
}

Result<void> App::run() {
    TerminalSession session;
    if (auto res = session.enter(); !res) {
        return Err<void>("Failed to set up terminal", res);
    }

    g_resized = 0;
    if (auto res = updateTerminalSize(); !res) {
        return res;
    }
    spdlog::info("App: running, world {}x{}", _sim->grid().width(), _sim->grid().height());

    while (!_sim->quitRequested()) {
        if (_sim->needsRedraw()) {
            if (auto res = draw(); !res) {
                return res;
            }
            _sim->markDrawn();
        }

        auto now = Simulation::Clock::now();
        auto wait = IDLE_POLL_TIMEOUT;
        if (_sim->stepsAutomatically()) {
            auto due = std::chrono::ceil<std::chrono::milliseconds>(_sim->untilNextStep(now));
            wait = std::min(wait, due);
        }

        struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
        int ret = poll(&pfd, 1, static_cast<int>(wait.count()));
        if (ret < 0 && errno != EINTR) {
            return Err<void>(std::string("poll failed: ") + std::strerror(errno));
        }

        if (g_resized) {
            g_resized = 0;
            if (auto res = updateTerminalSize(); !res) {
                return res;
            }
        }

        if (ret > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
            if (auto res = processInput(); !res) {
                return res;
            }
        }

        _sim->tick(Simulation::Clock::now());
    }

    spdlog::info("App: quit after {} steps, seed={}", _sim->steps(), _sim->seed());
    return Ok();
}

Result<std::string> App::runHeadless(uint64_t steps) {
    for (uint64_t i = 0; i < steps; ++i) {
        _sim->stepActive();
    }
    spdlog::info("App: headless run of {} {} steps, seed={}", steps, modeName(_sim->mode()), _sim->seed());
    return Ok(TerminalRenderer::dumpWorld(_sim->grid()));
}

} // namespace cavern
