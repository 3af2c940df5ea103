#pragma once

#include "core/services/IAlertSink.hpp"

#include <cstddef>

namespace mping::infra {

/**
 * @brief Alert sink that rings the terminal bell and logs the transition.
 *
 * Must be called on the thread that owns the curses screen. Without an
 * initialized screen the bell is a no-op and only the log entry is written.
 */
class TerminalBellAlert : public core::IAlertSink {
public:
    explicit TerminalBellAlert(bool audible = true);

    void notify(const core::Alert& alert) override;

    [[nodiscard]] std::size_t deliveredCount() const { return delivered_; }

private:
    bool audible_;
    std::size_t delivered_{0};
};

} // namespace mping::infra
