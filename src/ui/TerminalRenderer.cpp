#include "ui/TerminalRenderer.hpp"

#include "ui/RowFormatter.hpp"

#include <curses.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <stdexcept>
#include <vector>

namespace mping::ui {

namespace {

constexpr std::array<bool, kColumnCount> kRightAligned{false, false, false, true, true, true};

constexpr std::size_t kStatusColumn = 2;

constexpr const char* kTitle = "MPING";
constexpr const char* kLegend =
    "up/k down/j move  a add  e edit  d delete  s save  r reload  o options  q quit";

std::string alignColumn(const std::string& text, std::size_t col, std::size_t width) {
    if (!kRightAligned[col] || text.size() >= width) {
        return fitColumn(text, width);
    }
    return std::string(width - text.size(), ' ') + text;
}

} // namespace

TerminalRenderer::TerminalRenderer(bool color) : color_(color) {}

TerminalRenderer::~TerminalRenderer() {
    close();
}

void TerminalRenderer::open() {
    if (open_) {
        return;
    }

    set_escdelay(25);
    if (newterm(nullptr, stdout, stdin) == nullptr) {
        throw std::runtime_error("Failed to initialize the terminal");
    }
    open_ = true;

    cbreak();
    noecho();
    nodelay(stdscr, TRUE);
    keypad(stdscr, TRUE);
    curs_set(0);

    if (color_ && has_colors()) {
        setupColors();
    }

    auto [width, height] = size();
    spdlog::info("Terminal opened ({}x{}, colors {})", width, height,
                 colorsActive_ ? "on" : "off");
}

void TerminalRenderer::close() {
    if (!open_) {
        return;
    }
    endwin();
    open_ = false;
    spdlog::info("Terminal closed");
}

std::pair<int, int> TerminalRenderer::size() const {
    if (!open_) {
        return {0, 0};
    }
    int height = 0;
    int width = 0;
    getmaxyx(stdscr, height, width);
    return {width, height};
}

void TerminalRenderer::resize(int width, int height) {
    if (!open_ || width <= 0 || height <= 0) {
        return;
    }
    resizeterm(height, width);
    spdlog::debug("Terminal resized to {}x{}", width, height);
}

int TerminalRenderer::readKey() {
    if (!open_) {
        return ERR;
    }
    return getch();
}

void TerminalRenderer::setupColors() {
    start_color();
    use_default_colors();
    init_pair(CP_TITLE, COLOR_CYAN, -1);
    init_pair(CP_UP, COLOR_GREEN, -1);
    init_pair(CP_DOWN, COLOR_RED, -1);
    init_pair(CP_FLASH_UP, COLOR_BLACK, COLOR_GREEN);
    init_pair(CP_FLASH_DOWN, COLOR_WHITE, COLOR_RED);
    init_pair(CP_MESSAGE, COLOR_MAGENTA, -1);
    colorsActive_ = true;
}

int TerminalRenderer::attr(ColorPair pair, int fallback) const {
    if (!colorsActive_) {
        return fallback;
    }
    return COLOR_PAIR(pair);
}

void TerminalRenderer::render(const core::HostTable& table, const viewmodels::UiState& ui,
                              core::TimePoint now) {
    if (!open_) {
        return;
    }

    auto [width, height] = size();
    erase();

    drawHeader(width);

    int messageRow = height - 1;
    int bodyBottom = ui.message.empty() ? height : height - 2;
    constexpr int bodyTop = 3;

    switch (ui.mode) {
    case viewmodels::Mode::List:
        drawTable(table, ui, now, bodyTop, bodyBottom, width);
        break;
    case viewmodels::Mode::Add:
    case viewmodels::Mode::Edit:
        drawHostForm(ui, bodyTop, width);
        break;
    case viewmodels::Mode::ConfirmDelete:
        drawConfirmDelete(table, ui, bodyTop, width);
        break;
    case viewmodels::Mode::Options:
        drawOptions(ui, bodyTop, width);
        break;
    }

    if (!ui.message.empty()) {
        drawMessage(ui.message, messageRow, width);
    }

    refresh();
}

void TerminalRenderer::drawHeader(int width) {
    attron(attr(CP_TITLE, A_BOLD) | A_BOLD);
    drawCentered(0, width, kTitle);
    attroff(attr(CP_TITLE, A_BOLD) | A_BOLD);
    drawCentered(1, width, kLegend);
}

void TerminalRenderer::drawTable(const core::HostTable& table, const viewmodels::UiState& ui,
                                 core::TimePoint now, int top, int bottom, int width) {
    std::vector<RowCells> cells;
    cells.reserve(table.size());
    for (std::size_t row = 0; row < table.size(); ++row) {
        cells.push_back(formatRow(table.host(row), table.status(row), now));
    }

    auto widths = columnWidths(cells, static_cast<std::size_t>(std::max(0, width)));
    int left = std::max(0, (width - static_cast<int>(tableWidth(widths))) / 2);

    auto drawCells = [&](int y, const RowCells& row, auto cellAttr) {
        int x = left;
        for (std::size_t col = 0; col < kColumnCount; ++col) {
            if (x < width) {
                int attrs = cellAttr(col);
                attron(attrs);
                mvaddnstr(y, x, alignColumn(row[col], col, widths[col]).c_str(), width - x);
                attroff(attrs);
            }
            x += static_cast<int>(widths[col] + kColumnGap);
        }
    };

    drawCells(top, columnTitles(), [](std::size_t) { return static_cast<int>(A_BOLD); });

    int visibleRows = std::max(0, bottom - top - 1);
    if (table.empty()) {
        if (visibleRows > 0) {
            drawCentered(top + 1, width, "No hosts. Press 'a' to add one.");
        }
        return;
    }

    firstRow_ = firstVisibleRow(ui.cursor, table.size(), static_cast<std::size_t>(visibleRows),
                                firstRow_);
    auto lastRow = std::min(table.size(), firstRow_ + static_cast<std::size_t>(visibleRows));

    for (auto row = firstRow_; row < lastRow; ++row) {
        const auto& status = table.status(row);
        int y = top + 1 + static_cast<int>(row - firstRow_);

        bool selected = row == ui.cursor && ui.mode == viewmodels::Mode::List;
        bool flashing = status.isFlashing(now) && !selected;

        int rowAttr = A_NORMAL;
        if (selected) {
            rowAttr = A_REVERSE;
        } else if (flashing) {
            rowAttr = status.reachable ? attr(CP_FLASH_UP, A_BOLD) | A_BOLD
                                       : attr(CP_FLASH_DOWN, A_BOLD) | A_BOLD;
        }

        drawCells(y, cells[row], [&](std::size_t col) {
            if (col == kStatusColumn && !selected && status.observed()) {
                return status.reachable ? attr(CP_UP, A_BOLD) : attr(CP_DOWN, A_DIM);
            }
            return rowAttr;
        });
    }
}

void TerminalRenderer::drawHostForm(const viewmodels::UiState& ui, int top, int width) {
    const auto& form = ui.hostForm;
    bool editing = ui.mode == viewmodels::Mode::Edit;

    drawCentered(top, width, editing ? "Edit host:" : "Add new host:");

    auto field = [](const char* label, const std::string& value, bool focused) {
        return std::string(focused ? "> " : "  ") + label + value + (focused ? "_" : "");
    };
    drawCentered(top + 1, width,
                 field("Host: ", form.address, form.focus == viewmodels::HostField::Address));
    drawCentered(top + 2, width,
                 field("Desc: ", form.description,
                       form.focus == viewmodels::HostField::Description));
    drawCentered(top + 4, width, "Press Tab to switch, Enter to confirm, Esc to cancel");
}

void TerminalRenderer::drawConfirmDelete(const core::HostTable& table,
                                         const viewmodels::UiState& ui, int top, int width) {
    if (!ui.confirmIndex || *ui.confirmIndex >= table.size()) {
        return;
    }
    drawCentered(top, width, "Delete host '" + table.host(*ui.confirmIndex).address + "'? (y/n)");
}

void TerminalRenderer::drawOptions(const viewmodels::UiState& ui, int top, int width) {
    const auto& options = ui.options;
    bool intervalFocused = options.focus == viewmodels::OptionsField::Interval;

    drawCentered(top, width, "Options:");
    drawCentered(top + 1, width,
                 std::string(intervalFocused ? "> " : "  ") + "Interval (s): " +
                     options.interval + (intervalFocused ? "_" : ""));
    drawCentered(top + 2, width, std::string(intervalFocused ? "  " : "> ") + "Sort by:");

    int y = top + 3;
    for (std::size_t i = 0; i < core::kSortKeys.size(); ++i, ++y) {
        std::string line = (i == options.sortIndex ? "  * " : "    ") +
                           core::sortKeyLabel(core::kSortKeys[i]);
        if (i == options.sortIndex && !intervalFocused) {
            attron(A_REVERSE);
            drawCentered(y, width, line);
            attroff(A_REVERSE);
        } else {
            drawCentered(y, width, line);
        }
    }

    drawCentered(y + 1, width,
                 "Press Tab to switch, Up/Down to choose, Enter to confirm, Esc to cancel");
}

void TerminalRenderer::drawMessage(const std::string& message, int row, int width) {
    attron(attr(CP_MESSAGE, A_BOLD));
    drawCentered(row, width, message);
    attroff(attr(CP_MESSAGE, A_BOLD));
}

void TerminalRenderer::drawCentered(int row, int width, const std::string& text) {
    if (row < 0 || width <= 0) {
        return;
    }
    int x = std::max(0, (width - static_cast<int>(text.size())) / 2);
    mvaddnstr(row, x, text.c_str(), width - x);
}

} // namespace mping::ui
