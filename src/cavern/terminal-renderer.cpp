#include <cavern/terminal-renderer.h>

#include <algorithm>
#include <sstream>

namespace cavern {

namespace {

constexpr const char* CELL_FILLED = "██";
constexpr const char* CELL_EMPTY = "  ";
constexpr const char* REVERSE_ON = "\033[7m";
constexpr const char* REVERSE_OFF = "\033[27m";
constexpr const char* CLEAR_EOL = "\033[K";

constexpr const char* BORDER_H = "━";
constexpr const char* BORDER_V = "┃";
constexpr const char* BORDER_TL = "┏";
constexpr const char* BORDER_TR = "┓";
constexpr const char* BORDER_BL = "┗";
constexpr const char* BORDER_BR = "┛";

constexpr const char* TITLE = " Cave! ";
constexpr uint32_t TITLE_COLS = 7;

void moveTo(std::string& out, uint32_t row, uint32_t col) {
    out += "\033[" + std::to_string(row) + ";" + std::to_string(col) + "H";
}

void repeat(std::string& out, const char* s, uint32_t n) {
    for (uint32_t i = 0; i < n; ++i) out += s;
}

// ASCII only; clips to cols
std::string fit(std::string line, uint32_t cols) {
    if (line.size() > cols) line.resize(cols);
    return line;
}

} // namespace

ViewSize TerminalRenderer::viewSizeFor(uint32_t cols, uint32_t rows) noexcept {
    if (cols <= CHROME_COLS || rows <= CHROME_ROWS) return {};
    return {(cols - CHROME_COLS) / CELL_COLS, rows - CHROME_ROWS};
}

std::string TerminalRenderer::statusLine(const Simulation& sim) {
    const auto& cam = sim.camera();
    std::ostringstream ss;
    ss << " mode: " << modeName(sim.mode())
       << " | seed: " << sim.seed()
       << " | " << (sim.running() ? "running" : "paused")
       << " | cursor: " << sim.cursor().x << "," << sim.cursor().y
       << " | world: " << sim.grid().width() << "x" << sim.grid().height()
       << " | view: " << cam.viewWidth() << "x" << cam.viewHeight()
       << " | steps: " << sim.steps();
    return ss.str();
}

std::string TerminalRenderer::helpLine() {
    return " arrows/hjkl move  space toggle  p run  s step  1 paint  2 life  3 drunk"
           "  r regen  n new seed  c clear  q quit";
}

std::string TerminalRenderer::enterScreen() {
    return "\033[?1049h\033[?25l\033[2J";
}

std::string TerminalRenderer::leaveScreen() {
    return "\033[0m\033[?25h\033[?1049l";
}

std::string TerminalRenderer::renderFrame(const Simulation& sim, uint32_t cols, uint32_t rows) const {
    std::string out;

    if (cols <= CHROME_COLS + TITLE_COLS || rows <= CHROME_ROWS) {
        out += "\033[2J";
        moveTo(out, 1, 1);
        out += fit("terminal too small", cols);
        return out;
    }

    const uint32_t innerCols = cols - CHROME_COLS;
    const uint32_t innerRows = rows - CHROME_ROWS;

    const auto& cam = sim.camera();
    const Point origin = cam.origin();
    const Point cursor = sim.cursor();
    const uint32_t drawCols = std::min(cam.viewWidth(), innerCols / CELL_COLS);
    const uint32_t drawRows = std::min(cam.viewHeight(), innerRows);

    out.reserve(static_cast<size_t>(cols) * rows * 3);

    moveTo(out, 1, 1);
    out += fit(statusLine(sim), cols);
    out += CLEAR_EOL;

    // Top border with centered title
    moveTo(out, 2, 1);
    const uint32_t left = (innerCols - TITLE_COLS) / 2;
    out += BORDER_TL;
    repeat(out, BORDER_H, left);
    out += TITLE;
    repeat(out, BORDER_H, innerCols - TITLE_COLS - left);
    out += BORDER_TR;

    for (uint32_t r = 0; r < innerRows; ++r) {
        moveTo(out, 3 + r, 1);
        out += BORDER_V;
        uint32_t used = 0;
        if (r < drawRows) {
            const int32_t y = origin.y + static_cast<int32_t>(r);
            for (uint32_t c = 0; c < drawCols; ++c) {
                const int32_t x = origin.x + static_cast<int32_t>(c);
                const char* cell = sim.grid().get(x, y).value_or(false) ? CELL_FILLED : CELL_EMPTY;
                if (x == cursor.x && y == cursor.y) {
                    out += REVERSE_ON;
                    out += cell;
                    out += REVERSE_OFF;
                } else {
                    out += cell;
                }
            }
            used = drawCols * CELL_COLS;
        }
        out.append(innerCols - used, ' ');
        out += BORDER_V;
    }

    moveTo(out, rows - 1, 1);
    out += BORDER_BL;
    repeat(out, BORDER_H, innerCols);
    out += BORDER_BR;

    moveTo(out, rows, 1);
    out += fit(helpLine(), cols);
    out += CLEAR_EOL;

    return out;
}

std::string TerminalRenderer::dumpWorld(const Grid& grid) {
    std::string out;
    out.reserve(static_cast<size_t>(grid.width() + 1) * grid.height());
    for (uint32_t y = 0; y < grid.height(); ++y) {
        for (uint32_t x = 0; x < grid.width(); ++x) {
            bool wall = grid.get(static_cast<int32_t>(x), static_cast<int32_t>(y)).value_or(false);
            out += wall ? '#' : '.';
        }
        out += '\n';
    }
    return out;
}

} // namespace cavern
