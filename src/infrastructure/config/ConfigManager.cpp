#include "infrastructure/config/ConfigManager.hpp"

#include "viewmodels/DashboardViewModel.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cmath>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace mping::infra {

namespace {

long long parseInteger(const std::string& option, const std::string& value, long long min,
                       long long max) {
    long long result = 0;
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), last, result);
    if (value.empty() || ec != std::errc{} || ptr != last) {
        throw std::invalid_argument("Invalid value for " + option + ": '" + value + "'");
    }
    if (result < min || result > max) {
        throw std::invalid_argument(option + " must be between " + std::to_string(min) +
                                    " and " + std::to_string(max));
    }
    return result;
}

} // namespace

void ConfigManager::parse(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    parse(args);
}

void ConfigManager::parse(const std::vector<std::string>& args) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string option = args[i];
        std::optional<std::string> inlineValue;

        if (option.rfind("--", 0) == 0) {
            auto eq = option.find('=');
            if (eq != std::string::npos) {
                inlineValue = option.substr(eq + 1);
                option = option.substr(0, eq);
            }
        }

        auto value = [&]() -> std::string {
            if (inlineValue) {
                return *inlineValue;
            }
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for " + option);
            }
            return args[++i];
        };

        if (option == "-h" || option == "--help") {
            config_.showHelp = true;
        } else if (option == "-f" || option == "--hosts") {
            auto path = value();
            if (path.empty()) {
                throw std::invalid_argument("Host file path cannot be empty");
            }
            config_.hostsFile = path;
        } else if (option == "-i" || option == "--interval") {
            auto text = value();
            auto seconds = viewmodels::parseIntervalSeconds(text);
            if (!seconds) {
                throw std::invalid_argument("Invalid value for " + option + ": '" + text + "'");
            }
            if (*seconds < 0.5 || *seconds > 5.0) {
                throw std::invalid_argument("Interval must be between 0.5 and 5 seconds");
            }
            config_.interval = std::chrono::milliseconds(std::llround(*seconds * 1000.0));
        } else if (option == "--sort") {
            auto text = value();
            auto key = core::sortKeyFromString(text);
            if (!key) {
                throw std::invalid_argument("Unknown sort key '" + text +
                                            "' (expected name, ip, status, reply or age)");
            }
            config_.sortKey = *key;
        } else if (option == "--timeout") {
            config_.probeTimeout =
                std::chrono::milliseconds(parseInteger(option, value(), 100, 60000));
        } else if (option == "--workers") {
            config_.workerCount = static_cast<std::size_t>(parseInteger(option, value(), 1, 256));
        } else if (option == "--log-file") {
            auto path = value();
            if (path.empty()) {
                throw std::invalid_argument("Log file path cannot be empty");
            }
            config_.logFile = path;
        } else if (option == "--log-level") {
            auto text = value();
            auto level = spdlog::level::from_str(text);
            if (level == spdlog::level::off && text != "off") {
                throw std::invalid_argument("Unknown log level '" + text + "'");
            }
            config_.logLevel = level;
        } else if (option == "--no-color") {
            if (inlineValue) {
                throw std::invalid_argument("--no-color does not take a value");
            }
            config_.color = false;
        } else {
            throw std::invalid_argument("Unknown option: " + option);
        }
    }
}

std::string ConfigManager::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "\n"
        << "Live terminal dashboard that pings a list of hosts.\n"
        << "\n"
        << "Options:\n"
        << "  -f, --hosts <path>       host list file (default: hosts.txt)\n"
        << "  -i, --interval <sec>     poll interval, 0.5 to 5 seconds (default: 5)\n"
        << "      --sort <key>         name, ip, status, reply or age (default: name)\n"
        << "      --timeout <ms>       ping deadline, 100 to 60000 (default: 2000)\n"
        << "      --workers <n>        probe worker threads, 1 to 256 (default: 32)\n"
        << "      --log-file <path>    log file (default: mping.log)\n"
        << "      --log-level <level>  trace, debug, info, warn, error, critical or off\n"
        << "      --no-color           monochrome display\n"
        << "  -h, --help               show this help and exit\n"
        << "\n"
        << "Keys: up/k down/j move, a add, e edit, d delete, s save, r reload,\n"
        << "      o options, q quit\n";
    return oss.str();
}

} // namespace mping::infra
