#include "infrastructure/notifications/TerminalBellAlert.hpp"

#include <curses.h>
#include <spdlog/spdlog.h>

namespace mping::infra {

TerminalBellAlert::TerminalBellAlert(bool audible) : audible_(audible) {}

void TerminalBellAlert::notify(const core::Alert& alert) {
    ++delivered_;
    if (alert.type == core::AlertType::HostDown) {
        spdlog::warn("Alert: {}", alert.message());
    } else {
        spdlog::info("Alert: {}", alert.message());
    }

    if (audible_ && stdscr != nullptr) {
        beep();
    }
}

} // namespace mping::infra
