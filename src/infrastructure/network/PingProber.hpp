#pragma once

#include "core/services/IProber.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace mping::infra {

/**
 * @brief Reachability probe backed by the system ping command.
 *
 * Runs `ping -c 1 -W <wait> <address>` without a shell and reads its
 * combined output through a pipe. The wait is half the deadline, in seconds
 * on Linux and in milliseconds on macOS and the BSDs. Windows is not
 * supported since probes are spawned with posix_spawn. The child is killed with SIGKILL and reaped once the
 * deadline passes or the prober is cancelled, so no process outlives a probe.
 *
 * @note Safe to call probe() from several threads at once.
 */
class PingProber : public core::IProber {
public:
    /**
     * @brief Constructs a PingProber.
     * @param timeout Hard deadline for one ping process.
     * @param command Executable looked up in PATH.
     */
    explicit PingProber(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000),
                        std::string command = "ping");

    core::ProbeOutcome probe(const std::string& address) override;
    void cancel() override;

    [[nodiscard]] bool isCancelled() const { return cancelled_; }
    [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }

    /**
     * @brief Checks whether an address may be passed to the ping command.
     *
     * Empty addresses and addresses starting with '-' are refused so that a
     * host entry can never be read as an option.
     */
    static bool isAcceptableAddress(const std::string& address);

    /**
     * @brief Arguments passed to the ping command for one probe, without argv[0].
     */
    static std::vector<std::string> arguments(const std::string& address,
                                              std::chrono::milliseconds timeout);

private:
    /**
     * @brief Spawns ping and collects its output.
     * @return The output, or std::nullopt on deadline or cancellation.
     * @throws std::runtime_error if the process cannot be started.
     */
    std::optional<std::string> runPing(const std::string& address);

    std::chrono::milliseconds timeout_;
    std::string command_;
    std::atomic<bool> cancelled_{false};
};

} // namespace mping::infra
