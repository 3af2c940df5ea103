/**
 * @file IAlertSink.hpp
 * @brief Interface for reachability transition notifications.
 */

#pragma once

#include "core/types/Alert.hpp"

namespace mping::core {

/**
 * @brief Receives one alert per reachability transition.
 */
class IAlertSink {
public:
    virtual ~IAlertSink() = default;

    /**
     * @brief Delivers an alert. Called on the interaction thread.
     * @param alert The transition that just happened.
     */
    virtual void notify(const Alert& alert) = 0;
};

} // namespace mping::core
