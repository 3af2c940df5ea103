#pragma once

#include "core/services/IAddressResolver.hpp"

#include <asio.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mping::infra {

/**
 * @brief Resolves hostnames asynchronously and caches the answers.
 *
 * Lookups run on asio's resolver thread and complete on the io_context, so
 * the cache is only touched from the thread running it. Successful answers
 * are kept for the process lifetime. Failures are remembered for a limited
 * time so an unresolvable host is retried later instead of on every resort.
 */
class SystemResolver : public core::IAddressResolver {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFunction = std::function<Clock::time_point()>;

    static constexpr std::chrono::seconds kDefaultFailureTtl{60};

    explicit SystemResolver(asio::io_context& io,
                            asio::ip::resolver_base::flags flags =
                                asio::ip::resolver_base::address_configured,
                            std::chrono::milliseconds failureTtl = kDefaultFailureTtl,
                            ClockFunction clock = Clock::now);

    std::optional<std::string> cached(const std::string& address) const override;
    bool needsLookup(const std::string& address) const override;

    /**
     * @brief Starts lookups for every address that needs one.
     *
     * @param addresses Hostnames or literal addresses.
     * @param done Called on the io_context once all lookups started by this
     *             call have completed.
     * @return False if nothing needed a lookup; done is then never called.
     */
    bool resolveAsync(const std::vector<std::string>& addresses, std::function<void()> done);

    /**
     * @brief Aborts pending lookups. Their callbacks are not invoked.
     */
    void cancel();

    /**
     * @brief Drops all cached answers and remembered failures.
     */
    void clearCache();

private:
    void complete(const std::string& address, const asio::error_code& ec,
                  const asio::ip::tcp::resolver::results_type& results);

    asio::ip::tcp::resolver resolver_;
    asio::ip::resolver_base::flags flags_;
    std::chrono::milliseconds failureTtl_;
    ClockFunction clock_;

    std::map<std::string, std::string> answers_;
    std::map<std::string, Clock::time_point> failedUntil_;
    std::set<std::string> inFlight_;
};

} // namespace mping::infra
