/**
 * @file Host.hpp
 * @brief Host definition for the monitoring dashboard.
 *
 * This file defines the Host structure which represents a monitored network
 * endpoint as it appears in the host list.
 */

#pragma once

#include <string>

namespace mping::core {

/**
 * @brief Represents a monitored network host.
 *
 * The address is the host's identity within the active set. Duplicate
 * addresses are allowed and treated as independent rows.
 */
struct Host {
    std::string address;     ///< IP address or hostname to probe
    std::string description; ///< Free-form label shown next to the address

    /**
     * @brief Validates the host entry.
     * @return True if the address is non-empty after trimming whitespace.
     */
    [[nodiscard]] bool isValid() const;

    /**
     * @brief Returns a copy with leading and trailing whitespace removed from both fields.
     */
    [[nodiscard]] Host trimmed() const;

    bool operator==(const Host& other) const = default;
};

/**
 * @brief Removes leading and trailing ASCII whitespace.
 */
std::string trim(const std::string& str);

/**
 * @brief Lower-cases ASCII letters, leaving other bytes untouched.
 */
std::string toLower(const std::string& str);

} // namespace mping::core
