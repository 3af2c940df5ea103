#pragma once

#include "viewmodels/DashboardState.hpp"

#include <optional>

namespace mping::ui {

/**
 * @brief Maps a curses getch() code to a dashboard key.
 * @return The key, or std::nullopt for codes the dashboard does not use.
 */
std::optional<viewmodels::KeyEvent> decodeKey(int ch);

} // namespace mping::ui
