#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>

#include "core/engine/OrderingEngine.hpp"
#include "core/engine/StatusTracker.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace mping::core;
using namespace std::chrono_literals;

namespace {

struct Rows {
    std::vector<Host> hosts;
    std::vector<StatusRecord> statuses;
    std::vector<ProbeOutcome> outcomes;
};

Rows makeRows(std::size_t count, TimePoint now) {
    Rows rows;
    rows.hosts.reserve(count);
    rows.statuses.reserve(count);
    rows.outcomes.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        // Scramble the names so the input is not already sorted.
        auto n = (i * 7919) % count;
        rows.hosts.push_back(
            Host{"host-" + std::to_string(n) + ".example", "rack " + std::to_string(i % 16)});

        StatusRecord record;
        record.reachable = (i % 3) != 0;
        if (record.reachable) {
            record.latencyMs = static_cast<double>((i * 37) % 200) / 10.0;
        }
        record.lastChangeAt = now - std::chrono::seconds(static_cast<long>(i % 600));
        rows.statuses.push_back(record);

        rows.outcomes.push_back(ProbeOutcome{(i % 5) != 0, static_cast<double>(i % 50)});
    }
    return rows;
}

} // namespace

// =============================================================================
// OrderingEngine Benchmarks
// =============================================================================

TEST_CASE("OrderingEngine benchmarks", "[benchmark][OrderingEngine]") {
    auto now = Clock::now();
    OrderingEngine engine;

    auto small = makeRows(50, now);
    auto large = makeRows(1000, now);

    BENCHMARK("Order 50 hosts by name") {
        return engine.order(small.hosts, small.statuses, SortKey::Name, now);
    };

    BENCHMARK("Order 1000 hosts by name") {
        return engine.order(large.hosts, large.statuses, SortKey::Name, now);
    };

    BENCHMARK("Order 1000 hosts by address") {
        return engine.order(large.hosts, large.statuses, SortKey::Address, now);
    };

    BENCHMARK("Order 1000 hosts by status") {
        return engine.order(large.hosts, large.statuses, SortKey::Status, now);
    };

    BENCHMARK("Order 1000 hosts by reply time") {
        return engine.order(large.hosts, large.statuses, SortKey::Latency, now);
    };

    BENCHMARK("Order 1000 hosts by age") {
        return engine.order(large.hosts, large.statuses, SortKey::Age, now);
    };
}

// =============================================================================
// StatusTracker Benchmarks
// =============================================================================

TEST_CASE("StatusTracker benchmarks", "[benchmark][StatusTracker]") {
    auto now = Clock::now();
    StatusTracker tracker;

    auto large = makeRows(1000, now);

    BENCHMARK("Reconcile a 1000 host batch") {
        return tracker.reconcile(large.statuses, large.outcomes, now + 1s);
    };
}
