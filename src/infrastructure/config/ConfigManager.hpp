#pragma once

#include "core/types/SortKey.hpp"

#include <spdlog/common.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace mping::infra {

/**
 * @brief Application configuration settings.
 *
 * Populated from the command line. Defaults apply to every option that is
 * not given.
 */
struct AppConfig {
    // Monitoring
    std::filesystem::path hostsFile{"hosts.txt"};     ///< Host list file.
    std::chrono::milliseconds interval{5000};         ///< Poll interval, 0.5 to 5 seconds.
    core::SortKey sortKey{core::SortKey::Name};       ///< Initial sort key.
    std::chrono::milliseconds probeTimeout{2000};     ///< Hard deadline of one ping.
    std::size_t workerCount{32};                      ///< Probe worker threads.

    // Logging
    std::filesystem::path logFile{"mping.log"};       ///< Rotating log file.
    spdlog::level::level_enum logLevel{spdlog::level::info}; ///< Minimum log level.

    // Display
    bool color{true};                                 ///< Use colors when the terminal has them.

    bool showHelp{false};                             ///< Print usage and exit.
};

/**
 * @brief Parses command-line options into an AppConfig.
 *
 * Accepts both `--option value` and `--option=value`. Every invalid value
 * raises std::invalid_argument naming the offending option.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /**
     * @brief Parses the process arguments.
     * @param argc Argument count as passed to main.
     * @param argv Argument vector as passed to main; argv[0] is skipped.
     * @throws std::invalid_argument on unknown options or invalid values.
     */
    void parse(int argc, const char* const* argv);

    /**
     * @brief Parses arguments without the program name.
     * @throws std::invalid_argument on unknown options or invalid values.
     */
    void parse(const std::vector<std::string>& args);

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Returns the usage text printed by --help.
     */
    static std::string usage(const std::string& program);

private:
    AppConfig config_;
};

} // namespace mping::infra
