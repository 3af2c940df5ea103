#include "app/EventLoop.hpp"

#include <spdlog/spdlog.h>

namespace mping::app {

EventLoop::EventLoop(asio::io_context& io, infra::ProbeRoundCoordinator& coordinator,
                     std::shared_ptr<infra::SystemResolver> resolver)
    : io_(io), coordinator_(coordinator), resolver_(std::move(resolver)), tickTimer_(io) {}

void EventLoop::armTick(std::chrono::milliseconds delay) {
    tickTimer_.expires_after(delay);
    tickTimer_.async_wait([this](const asio::error_code& ec) {
        if (ec) {
            return;
        }
        deliver(viewmodels::TickEvent{});
    });
}

void EventLoop::armRound(std::vector<core::Host> hosts, uint64_t version) {
    coordinator_.runRoundAsync(
        std::move(hosts), [this, version](std::vector<core::ProbeOutcome> outcomes) {
            asio::post(io_, [this, version, outcomes = std::move(outcomes)]() mutable {
                deliver(viewmodels::ProbeBatchEvent{version, std::move(outcomes),
                                                    core::Clock::now()});
            });
        });
}

void EventLoop::armResolve(std::vector<std::string> addresses) {
    if (!resolver_) {
        spdlog::debug("No resolver installed, ignoring {} lookups", addresses.size());
        return;
    }
    bool started =
        resolver_->resolveAsync(addresses, [this] { deliver(viewmodels::AddressesResolvedEvent{}); });
    if (!started) {
        spdlog::debug("All {} addresses already resolved or pending", addresses.size());
    }
}

void EventLoop::cancel() {
    tickTimer_.cancel();
    if (resolver_) {
        resolver_->cancel();
    }
}

void EventLoop::deliver(const viewmodels::DashboardEvent& event) {
    if (handler_) {
        handler_(event);
    } else {
        spdlog::debug("Dropping event, no handler installed");
    }
}

} // namespace mping::app
