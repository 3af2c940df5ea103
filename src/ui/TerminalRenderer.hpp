#pragma once

#include "core/types/HostTable.hpp"
#include "viewmodels/DashboardState.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace mping::ui {

/**
 * @brief Draws the dashboard with curses.
 *
 * open() takes over the terminal and close() (or the destructor) gives it
 * back. render() reads the table and UI state without modifying them. While a
 * dialog is open it replaces the table on screen.
 */
class TerminalRenderer {
public:
    explicit TerminalRenderer(bool color = true);
    ~TerminalRenderer();

    TerminalRenderer(const TerminalRenderer&) = delete;
    TerminalRenderer& operator=(const TerminalRenderer&) = delete;

    /**
     * @brief Initializes curses in cbreak, noecho, nodelay mode with keypad decoding.
     * @throws std::runtime_error if the terminal cannot be initialized.
     */
    void open();

    /**
     * @brief Restores the terminal. Safe to call more than once.
     */
    void close();

    [[nodiscard]] bool isOpen() const { return open_; }

    /**
     * @brief Current screen size as (width, height).
     */
    [[nodiscard]] std::pair<int, int> size() const;

    /**
     * @brief Adapts curses to a new terminal size.
     */
    void resize(int width, int height);

    /**
     * @brief Reads one pending key code, or ERR when none is pending.
     */
    int readKey();

    /**
     * @brief Draws one frame.
     */
    void render(const core::HostTable& table, const viewmodels::UiState& ui, core::TimePoint now);

private:
    enum ColorPair : short {
        CP_TITLE = 1,
        CP_UP,
        CP_DOWN,
        CP_FLASH_UP,
        CP_FLASH_DOWN,
        CP_MESSAGE,
    };

    void setupColors();
    int attr(ColorPair pair, int fallback) const;

    void drawHeader(int width);
    void drawTable(const core::HostTable& table, const viewmodels::UiState& ui,
                   core::TimePoint now, int top, int bottom, int width);
    void drawHostForm(const viewmodels::UiState& ui, int top, int width);
    void drawConfirmDelete(const core::HostTable& table, const viewmodels::UiState& ui, int top,
                           int width);
    void drawOptions(const viewmodels::UiState& ui, int top, int width);
    void drawMessage(const std::string& message, int row, int width);
    void drawCentered(int row, int width, const std::string& text);

    bool color_;
    bool colorsActive_{false};
    bool open_{false};
    std::size_t firstRow_{0};
};

} // namespace mping::ui
