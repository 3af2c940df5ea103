#include "infrastructure/network/PingProber.hpp"

#include "infrastructure/network/PingOutputParser.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mping::infra {

namespace {

constexpr std::chrono::milliseconds kPollSlice{50};

/// Closes a file descriptor when leaving scope.
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }

    void reset() {
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

std::string errnoMessage(const std::string& what, int error) {
    return what + ": " + std::strerror(error);
}

} // namespace

PingProber::PingProber(std::chrono::milliseconds timeout, std::string command)
    : timeout_(timeout), command_(std::move(command)) {
    spdlog::debug("PingProber using '{}' with {} ms deadline", command_, timeout_.count());
}

std::vector<std::string> PingProber::arguments(const std::string& address,
                                               std::chrono::milliseconds timeout) {
    // Let ping give up on its own slightly before the hard deadline.
#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
    // BSD ping takes the reply wait in milliseconds.
    auto wait = std::max<long long>(1, timeout.count() / 2);
#else
    // Linux ping takes the reply wait in whole seconds.
    auto wait = std::max<long long>(1, timeout.count() / 2000);
#endif
    return {"-c", "1", "-W", std::to_string(wait), address};
}

bool PingProber::isAcceptableAddress(const std::string& address) {
    return !address.empty() && address.front() != '-';
}

core::ProbeOutcome PingProber::probe(const std::string& address) {
    if (cancelled_) {
        return core::ProbeOutcome::unreachable();
    }
    if (!isAcceptableAddress(address)) {
        spdlog::debug("Refusing to probe address '{}'", address);
        return core::ProbeOutcome::unreachable();
    }

    try {
        auto output = runPing(address);
        if (!output) {
            spdlog::debug("Ping to {} timed out or was cancelled", address);
            return core::ProbeOutcome::unreachable();
        }

        auto outcome = parsePingOutput(*output);
        if (outcome.reachable && outcome.latencyMs) {
            spdlog::debug("Ping to {} successful: {:.2f}ms", address, *outcome.latencyMs);
        } else {
            spdlog::debug("Ping to {}: {}", address, outcome.reachable ? "up" : "down");
        }
        return outcome;
    } catch (const std::exception& e) {
        spdlog::debug("Ping to {} failed: {}", address, e.what());
        return core::ProbeOutcome::unreachable();
    }
}

void PingProber::cancel() {
    if (!cancelled_.exchange(true)) {
        spdlog::debug("PingProber cancelled");
    }
}

std::optional<std::string> PingProber::runPing(const std::string& address) {
    std::array<int, 2> fds{-1, -1};
    if (pipe2(fds.data(), O_CLOEXEC) != 0) {
        throw std::runtime_error(errnoMessage("pipe2 failed", errno));
    }
    FdGuard readEnd(fds[0]);
    FdGuard writeEnd(fds[1]);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, writeEnd.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, writeEnd.get(), STDERR_FILENO);

    auto args = arguments(address, timeout_);
    args.insert(args.begin(), command_);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, command_.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        throw std::runtime_error(errnoMessage("Failed to spawn " + command_, rc));
    }
    writeEnd.reset();

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    std::string output;
    std::array<char, 512> buffer{};
    bool aborted = false;

    while (true) {
        if (cancelled_) {
            aborted = true;
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining <= std::chrono::milliseconds::zero()) {
            aborted = true;
            break;
        }

        pollfd pfd{readEnd.get(), POLLIN, 0};
        auto slice = std::min(remaining, kPollSlice);
        int ready = poll(&pfd, 1, static_cast<int>(slice.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            aborted = true;
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = read(readEnd.get(), buffer.data(), buffer.size());
        if (n > 0) {
            output.append(buffer.data(), static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }

    if (aborted) {
        kill(pid, SIGKILL);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    if (aborted) {
        return std::nullopt;
    }
    return output;
}

} // namespace mping::infra
