/**
 * @file Alert.hpp
 * @brief Reachability transition alerts.
 */

#pragma once

#include "core/types/Host.hpp"
#include "core/types/StatusRecord.hpp"

#include <string>

namespace mping::core {

enum class AlertType : int { HostDown = 0, HostRecovered = 1 };

/**
 * @brief Notification raised once per reachability transition.
 */
struct Alert {
    AlertType type{AlertType::HostDown};
    Host host;
    TimePoint timestamp;

    [[nodiscard]] std::string typeToString() const;

    /**
     * @brief One-line description suitable for logs, e.g. "8.8.8.8 (dns) is DOWN".
     */
    [[nodiscard]] std::string message() const;

    /**
     * @brief Builds the alert matching a freshly reconciled record.
     */
    static Alert fromTransition(const Host& host, const StatusRecord& record);

    bool operator==(const Alert& other) const = default;
};

} // namespace mping::core
