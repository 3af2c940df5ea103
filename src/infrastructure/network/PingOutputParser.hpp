/**
 * @file PingOutputParser.hpp
 * @brief Interpretation of the output of the system ping command.
 */

#pragma once

#include "core/types/StatusRecord.hpp"

#include <string_view>

namespace mping::infra {

/**
 * @brief Turns the combined output of one `ping` invocation into an outcome.
 *
 * The host counts as reachable iff a line of the output contains "ttl=" in
 * any case. The latency is read from that reply line only, as the number
 * following "time=" or "time<", so a hostname containing "time" in the banner
 * line is never mistaken for it. A reply whose time cannot be parsed is
 * reachable without latency.
 *
 * @param output Combined stdout and stderr of the ping process.
 * @return The parsed outcome.
 */
core::ProbeOutcome parsePingOutput(std::string_view output);

} // namespace mping::infra
