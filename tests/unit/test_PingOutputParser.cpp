#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/PingOutputParser.hpp"

using namespace mping::infra;

TEST_CASE("Ping output from Linux", "[PingOutputParser]") {
    const char* output = "PING 8.8.8.8 (8.8.8.8) 56(84) bytes of data.\n"
                         "64 bytes from 8.8.8.8: icmp_seq=1 ttl=117 time=12.3 ms\n"
                         "\n"
                         "--- 8.8.8.8 ping statistics ---\n"
                         "1 packets transmitted, 1 received, 0% packet loss, time 0ms\n"
                         "rtt min/avg/max/mdev = 12.301/12.301/12.301/0.000 ms\n";

    auto outcome = parsePingOutput(output);
    REQUIRE(outcome.reachable);
    REQUIRE(outcome.latencyMs.has_value());
    REQUIRE(*outcome.latencyMs == Catch::Approx(12.3));
}

TEST_CASE("Ping output from macOS", "[PingOutputParser]") {
    const char* output = "PING 1.1.1.1 (1.1.1.1): 56 data bytes\n"
                         "64 bytes from 1.1.1.1: icmp_seq=0 ttl=58 time=7.512 ms\n";

    auto outcome = parsePingOutput(output);
    REQUIRE(outcome.reachable);
    REQUIRE(*outcome.latencyMs == Catch::Approx(7.512));
}

TEST_CASE("Ping output from Windows", "[PingOutputParser]") {
    SECTION("time=") {
        auto outcome = parsePingOutput("Reply from 10.0.0.1: bytes=32 time=4ms TTL=64\r\n");
        REQUIRE(outcome.reachable);
        REQUIRE(*outcome.latencyMs == Catch::Approx(4.0));
    }

    SECTION("time<1ms") {
        auto outcome = parsePingOutput("Reply from 10.0.0.1: bytes=32 time<1ms TTL=128\r\n");
        REQUIRE(outcome.reachable);
        REQUIRE(*outcome.latencyMs == Catch::Approx(1.0));
    }
}

TEST_CASE("Ping reply without a time", "[PingOutputParser]") {
    auto outcome = parsePingOutput("64 bytes from 10.0.0.1: icmp_seq=1 ttl=64\n");
    REQUIRE(outcome.reachable);
    REQUIRE_FALSE(outcome.latencyMs.has_value());

    auto garbled = parsePingOutput("64 bytes from 10.0.0.1: ttl=64 time=fast\n");
    REQUIRE(garbled.reachable);
    REQUIRE_FALSE(garbled.latencyMs.has_value());
}

TEST_CASE("Ping output without a reply", "[PingOutputParser]") {
    SECTION("Timeout") {
        auto outcome = parsePingOutput("PING 10.255.255.1 (10.255.255.1) 56(84) bytes of data.\n"
                                       "\n"
                                       "--- 10.255.255.1 ping statistics ---\n"
                                       "1 packets transmitted, 0 received, 100% packet loss, "
                                       "time 0ms\n");
        REQUIRE_FALSE(outcome.reachable);
        REQUIRE_FALSE(outcome.latencyMs.has_value());
    }

    SECTION("Unknown host") {
        auto outcome = parsePingOutput("ping: nosuchhost: Name or service not known\n");
        REQUIRE_FALSE(outcome.reachable);
    }

    SECTION("Empty output") {
        REQUIRE_FALSE(parsePingOutput("").reachable);
    }
}

TEST_CASE("Ping output for hostnames containing 'time'", "[PingOutputParser]") {
    SECTION("Digit after 'time' in the banner") {
        auto outcome = parsePingOutput(
            "PING time1.google.com (216.239.35.0) 56(84) bytes of data.\n"
            "64 bytes from time1.google.com (216.239.35.0): icmp_seq=1 ttl=113 time=12.3 ms\n");
        REQUIRE(outcome.reachable);
        REQUIRE(outcome.latencyMs.has_value());
        REQUIRE(*outcome.latencyMs == Catch::Approx(12.3));
    }

    SECTION("Dot after 'time' in the banner") {
        auto outcome = parsePingOutput(
            "PING time.cloudflare.com (162.159.200.1) 56(84) bytes of data.\n"
            "64 bytes from time.cloudflare.com (162.159.200.1): icmp_seq=1 ttl=57 time=8.4 ms\n");
        REQUIRE(outcome.reachable);
        REQUIRE(outcome.latencyMs.has_value());
        REQUIRE(*outcome.latencyMs == Catch::Approx(8.4));
    }

    SECTION("Reply line without a time") {
        auto outcome = parsePingOutput("PING time.example (10.0.0.9) 56(84) bytes of data.\n"
                                       "64 bytes from 10.0.0.9: icmp_seq=1 ttl=64\n");
        REQUIRE(outcome.reachable);
        REQUIRE_FALSE(outcome.latencyMs.has_value());
    }
}
