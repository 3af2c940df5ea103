#include "core/engine/OrderingEngine.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace mping::core {

namespace {

struct RowKey {
    std::string name;
    std::string description;
};

// -1 when a sorts first, 1 when b sorts first, 0 on a tie.
template <typename T>
int compareValues(const T& a, const T& b) {
    if (a < b) {
        return -1;
    }
    if (b < a) {
        return 1;
    }
    return 0;
}

int compareByName(const RowKey& a, const RowKey& b) {
    int cmp = compareValues(a.name, b.name);
    if (cmp != 0) {
        return cmp;
    }
    return compareValues(a.description, b.description);
}

double latencyRank(const StatusRecord& status) {
    if (status.reachable && status.latencyMs) {
        return *status.latencyMs;
    }
    return std::numeric_limits<double>::infinity();
}

} // namespace

OrderingEngine::OrderingEngine(std::shared_ptr<IAddressResolver> resolver)
    : resolver_(std::move(resolver)) {}

std::vector<std::string> OrderingEngine::addressKeys(const std::vector<Host>& hosts) const {
    std::vector<std::string> keys;
    keys.reserve(hosts.size());
    for (const auto& host : hosts) {
        std::optional<std::string> resolved;
        if (resolver_) {
            resolved = resolver_->cached(host.address);
        }
        keys.push_back(toLower(resolved.value_or(host.address)));
    }
    return keys;
}

std::vector<std::size_t> OrderingEngine::order(const std::vector<Host>& hosts,
                                               const std::vector<StatusRecord>& statuses,
                                               SortKey key, TimePoint now) const {
    if (hosts.size() != statuses.size()) {
        throw std::invalid_argument("Host and status sequences differ in length");
    }

    std::vector<RowKey> rows;
    rows.reserve(hosts.size());
    for (const auto& host : hosts) {
        rows.push_back(RowKey{toLower(host.address), host.description});
    }

    std::vector<std::string> addresses;
    if (key == SortKey::Address) {
        addresses = addressKeys(hosts);
    }

    std::vector<std::size_t> order(hosts.size());
    std::iota(order.begin(), order.end(), 0);

    std::stable_sort(order.begin(), order.end(), [&](std::size_t i, std::size_t j) {
        int cmp = 0;
        switch (key) {
        case SortKey::Name:
            break;
        case SortKey::Address:
            cmp = compareValues(addresses[i], addresses[j]);
            break;
        case SortKey::Status:
            // Reachable first
            cmp = compareValues(!statuses[i].reachable, !statuses[j].reachable);
            break;
        case SortKey::Latency:
            cmp = compareValues(latencyRank(statuses[i]), latencyRank(statuses[j]));
            break;
        case SortKey::Age: {
            const auto& a = statuses[i];
            const auto& b = statuses[j];
            cmp = compareValues(!a.observed(), !b.observed());
            if (cmp == 0 && a.observed()) {
                // Larger age first
                cmp = compareValues(b.age(now), a.age(now));
            }
            break;
        }
        }
        if (cmp == 0) {
            cmp = compareByName(rows[i], rows[j]);
        }
        return cmp < 0;
    });

    return order;
}

} // namespace mping::core
