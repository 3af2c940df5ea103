#include "infrastructure/network/SystemResolver.hpp"

#include <spdlog/spdlog.h>

#include <memory>

namespace mping::infra {

SystemResolver::SystemResolver(asio::io_context& io, asio::ip::resolver_base::flags flags,
                               std::chrono::milliseconds failureTtl, ClockFunction clock)
    : resolver_(io), flags_(flags), failureTtl_(failureTtl), clock_(std::move(clock)) {}

std::optional<std::string> SystemResolver::cached(const std::string& address) const {
    auto it = answers_.find(address);
    if (it == answers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SystemResolver::needsLookup(const std::string& address) const {
    if (address.empty() || answers_.count(address) != 0 || inFlight_.count(address) != 0) {
        return false;
    }
    auto failed = failedUntil_.find(address);
    return failed == failedUntil_.end() || clock_() >= failed->second;
}

bool SystemResolver::resolveAsync(const std::vector<std::string>& addresses,
                                  std::function<void()> done) {
    std::vector<std::string> pending;
    for (const auto& address : addresses) {
        if (needsLookup(address)) {
            inFlight_.insert(address);
            pending.push_back(address);
        }
    }
    if (pending.empty()) {
        return false;
    }

    spdlog::debug("Resolving {} addresses", pending.size());

    auto remaining = std::make_shared<std::size_t>(pending.size());
    auto callback = std::make_shared<std::function<void()>>(std::move(done));
    for (const auto& address : pending) {
        resolver_.async_resolve(
            address, "", flags_,
            [this, address, remaining, callback](
                const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
                inFlight_.erase(address);
                if (ec == asio::error::operation_aborted) {
                    return;
                }
                complete(address, ec, results);
                if (--*remaining == 0 && *callback) {
                    (*callback)();
                }
            });
    }
    return true;
}

void SystemResolver::cancel() {
    resolver_.cancel();
}

void SystemResolver::clearCache() {
    answers_.clear();
    failedUntil_.clear();
}

void SystemResolver::complete(const std::string& address, const asio::error_code& ec,
                              const asio::ip::tcp::resolver::results_type& results) {
    if (!ec) {
        for (const auto& entry : results) {
            auto resolved = entry.endpoint().address().to_string();
            spdlog::debug("Resolved {} to {}", address, resolved);
            answers_[address] = resolved;
            failedUntil_.erase(address);
            return;
        }
    }

    spdlog::debug("Failed to resolve {}: {}", address, ec ? ec.message() : "no addresses");
    failedUntil_[address] = clock_() + failureTtl_;
}

} // namespace mping::infra
