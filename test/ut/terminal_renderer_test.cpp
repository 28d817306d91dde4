//=============================================================================
// TerminalRenderer Unit Tests
//=============================================================================

#include <boost/ut.hpp>
#include <cavern/terminal-renderer.h>

#include <string>

using namespace boost::ut;
using namespace cavern;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

size_t occurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

SimulationConfig emptyWorld(uint32_t w, uint32_t h) {
    SimulationConfig cfg;
    cfg.worldWidth = w;
    cfg.worldHeight = h;
    cfg.initial = InitialMap::Empty;
    cfg.seed = 3;
    return cfg;
}

} // namespace

suite terminal_renderer_tests = [] {
    "view size leaves room for border and status lines"_test = [] {
        auto v = TerminalRenderer::viewSizeFor(80, 24);
        expect(v.width == 39_u);
        expect(v.height == 20_u);

        auto odd = TerminalRenderer::viewSizeFor(81, 5);
        expect(odd.width == 39_u);
        expect(odd.height == 1_u);

        auto none = TerminalRenderer::viewSizeFor(2, 4);
        expect(none.width == 0_u);
        expect(none.height == 0_u);
    };

    "status line reports the simulation state"_test = [] {
        Simulation sim(emptyWorld(30, 20));
        sim.resizeView(10, 5);
        auto line = TerminalRenderer::statusLine(sim);
        expect(line == std::string(" mode: paint | seed: 3 | paused | cursor: 15,10 | world: 30x20"
                                   " | view: 10x5 | steps: 0"));

        sim.setMode(Mode::Life, Simulation::Clock::now());
        sim.toggleRunning(Simulation::Clock::now());
        line = TerminalRenderer::statusLine(sim);
        expect(contains(line, "mode: life"));
        expect(contains(line, "running"));
    };

    "frame draws border, cells and the cursor"_test = [] {
        Simulation sim(emptyWorld(6, 4));
        sim.grid().set(0, 0, true);
        sim.grid().set(5, 3, true);

        const uint32_t cols = 20;
        const uint32_t rows = 10;
        auto view = TerminalRenderer::viewSizeFor(cols, rows);
        sim.resizeView(view.width, view.height);

        TerminalRenderer renderer;
        auto frame = renderer.renderFrame(sim, cols, rows);

        expect(contains(frame, TerminalRenderer::statusLine(sim)));
        expect(contains(frame, " Cave! "));
        expect(contains(frame, "┏"));
        expect(contains(frame, "┛"));
        expect(occurrences(frame, "┃") == 2u * (rows - TerminalRenderer::CHROME_ROWS));

        // Two walls drawn, cursor (3,2) on an empty cell in reverse video
        expect(occurrences(frame, "██") == 2_ul);
        expect(contains(frame, "\033[7m  \033[27m"));

        sim.toggleCell();
        frame = renderer.renderFrame(sim, cols, rows);
        expect(contains(frame, "\033[7m██\033[27m"));
        expect(occurrences(frame, "██") == 3_ul);
    };

    "frame only shows cells inside the camera"_test = [] {
        Simulation sim(emptyWorld(100, 100));
        sim.grid().set(0, 0, true);
        sim.grid().set(99, 99, true);
        sim.resizeView(8, 6);

        TerminalRenderer renderer;
        auto frame = renderer.renderFrame(sim, 18, 10);
        expect(occurrences(frame, "██") == 0_ul) << "both walls are off screen";

        sim.moveCursor(100, 100);
        frame = renderer.renderFrame(sim, 18, 10);
        expect(occurrences(frame, "██") == 1_ul);
    };

    "tiny terminal gets a notice instead of a frame"_test = [] {
        Simulation sim(emptyWorld(10, 10));
        TerminalRenderer renderer;
        auto frame = renderer.renderFrame(sim, 9, 30);
        expect(contains(frame, "terminal "));
        expect(!contains(frame, "┏"));

        frame = renderer.renderFrame(sim, 80, 4);
        expect(contains(frame, "terminal too small"));
    };

    "screen setup and teardown are symmetric"_test = [] {
        expect(contains(TerminalRenderer::enterScreen(), "\033[?1049h"));
        expect(contains(TerminalRenderer::leaveScreen(), "\033[?1049l"));
        expect(contains(TerminalRenderer::leaveScreen(), "\033[?25h"));
    };

    "world dump marks walls and floor"_test = [] {
        Grid g(4, 3);
        g.set(0, 0, true);
        g.set(3, 2, true);
        expect(TerminalRenderer::dumpWorld(g) == std::string("#...\n....\n...#\n"));
    };
};
