#include <catch2/catch_test_macros.hpp>

#include "app/EventLoop.hpp"
#include "support/Fakes.hpp"

using namespace mping;
using namespace std::chrono_literals;

namespace {

struct EventLoopFixture {
    EventLoopFixture() : coordinator(prober, 2), loop(io, coordinator, resolver) {
        coordinator.start();
        loop.setHandler([this](const viewmodels::DashboardEvent& event) { events.push_back(event); });
    }

    ~EventLoopFixture() { coordinator.shutdown(); }

    template <typename T>
    std::size_t count() const {
        std::size_t n = 0;
        for (const auto& event : events) {
            if (std::holds_alternative<T>(event)) {
                ++n;
            }
        }
        return n;
    }

    std::shared_ptr<testing::ScriptedProber> prober = std::make_shared<testing::ScriptedProber>();
    asio::io_context io;
    std::shared_ptr<infra::SystemResolver> resolver = std::make_shared<infra::SystemResolver>(
        io, asio::ip::resolver_base::numeric_host);
    infra::ProbeRoundCoordinator coordinator;
    app::EventLoop loop;
    std::vector<viewmodels::DashboardEvent> events;
};

} // namespace

TEST_CASE("EventLoop delivers ticks", "[EventLoop]") {
    EventLoopFixture f;

    SECTION("A tick fires once") {
        f.loop.armTick(10ms);
        f.io.run_for(200ms);
        REQUIRE(f.count<viewmodels::TickEvent>() == 1);
    }

    SECTION("Re-arming replaces the pending tick") {
        f.loop.armTick(20ms);
        f.loop.armTick(30ms);
        f.io.run_for(200ms);
        REQUIRE(f.count<viewmodels::TickEvent>() == 1);
    }

    SECTION("A cancelled tick never fires") {
        f.loop.armTick(20ms);
        f.loop.cancel();
        f.io.run_for(100ms);
        REQUIRE(f.events.empty());
    }
}

TEST_CASE("EventLoop delivers probe batches on the io_context", "[EventLoop]") {
    EventLoopFixture f;
    f.prober->set("a.example", core::ProbeOutcome{true, 4.0});

    auto before = core::Clock::now();
    f.loop.armRound({{"a.example", ""}, {"b.example", ""}}, 7);

    auto work = asio::make_work_guard(f.io);
    asio::steady_timer guard(f.io, 2s);
    guard.async_wait([&](const asio::error_code&) { work.reset(); });
    while (f.events.empty() && f.io.run_one_for(2s) > 0) {
    }

    REQUIRE(f.count<viewmodels::ProbeBatchEvent>() == 1);
    const auto& batch = std::get<viewmodels::ProbeBatchEvent>(f.events.front());
    REQUIRE(batch.version == 7);
    REQUIRE(batch.outcomes.size() == 2);
    REQUIRE(batch.outcomes[0] == core::ProbeOutcome{true, 4.0});
    REQUIRE_FALSE(batch.outcomes[1].reachable);
    REQUIRE(batch.receivedAt >= before);

    guard.cancel();
}

TEST_CASE("EventLoop reports finished name lookups", "[EventLoop]") {
    EventLoopFixture f;

    f.loop.armResolve({"127.0.0.1", "not-an-address"});
    REQUIRE(f.events.empty());
    f.io.run_for(2s);

    REQUIRE(f.count<viewmodels::AddressesResolvedEvent>() == 1);
    REQUIRE(f.resolver->cached("127.0.0.1") == "127.0.0.1");
    REQUIRE_FALSE(f.resolver->needsLookup("not-an-address"));

    SECTION("Nothing left to look up delivers nothing") {
        f.loop.armResolve({"127.0.0.1"});
        f.io.restart();
        f.io.run_for(100ms);
        REQUIRE(f.count<viewmodels::AddressesResolvedEvent>() == 1);
    }
}
