#include <catch2/catch_test_macros.hpp>

#include "ui/RowFormatter.hpp"

using namespace mping::core;
using namespace mping::ui;
using namespace std::chrono_literals;

TEST_CASE("RowFormatter status and latency cells", "[RowFormatter]") {
    auto now = Clock::now();

    StatusRecord unobserved;
    REQUIRE(formatStatus(unobserved) == "-");
    REQUIRE(formatAge(unobserved, now) == "-");

    StatusRecord up{true, 12.34, now - 90s, std::nullopt};
    REQUIRE(formatStatus(up) == "UP");
    REQUIRE(formatAge(up, now) == "90");

    StatusRecord down{false, std::nullopt, now - 1500ms, std::nullopt};
    REQUIRE(formatStatus(down) == "DOWN");
    REQUIRE(formatAge(down, now) == "1");

    REQUIRE(formatLatency(12.34) == "12.3");
    REQUIRE(formatLatency(0.05) == "0.1");
    REQUIRE(formatLatency(std::nullopt) == "-");
}

TEST_CASE("RowFormatter clock cell", "[RowFormatter]") {
    REQUIRE(formatClock(std::nullopt) == "-");

    auto text = formatClock(Clock::now());
    REQUIRE(text.size() == 8);
    REQUIRE(text[2] == ':');
    REQUIRE(text[5] == ':');
}

TEST_CASE("RowFormatter column fitting", "[RowFormatter]") {
    REQUIRE(fitColumn("abc", 6) == "abc   ");
    REQUIRE(fitColumn("abcdef", 6) == "abcdef");
    REQUIRE(fitColumn("abcdefgh", 6) == "abcdef");
    REQUIRE(fitColumn("", 2) == "  ");
    REQUIRE(fitColumn("abc", 0).empty());
}

TEST_CASE("RowFormatter scrolling window", "[RowFormatter]") {
    SECTION("Everything fits") {
        REQUIRE(firstVisibleRow(4, 5, 10, 3) == 0);
        REQUIRE(firstVisibleRow(0, 0, 0, 0) == 0);
    }

    SECTION("Cursor inside the window keeps it") {
        REQUIRE(firstVisibleRow(12, 50, 10, 10) == 10);
    }

    SECTION("Cursor below the window scrolls down") {
        REQUIRE(firstVisibleRow(25, 50, 10, 10) == 16);
    }

    SECTION("Cursor above the window scrolls up") {
        REQUIRE(firstVisibleRow(3, 50, 10, 10) == 3);
    }

    SECTION("Window never runs past the last row") {
        REQUIRE(firstVisibleRow(15, 20, 10, 18) == 10);
    }
}

TEST_CASE("RowFormatter row cells", "[RowFormatter]") {
    auto now = Clock::now();
    Host host{"10.0.0.1", "router"};
    StatusRecord status{true, 4.31, now - 3s, std::nullopt};

    auto cells = formatRow(host, status, now);
    REQUIRE(cells[0] == "10.0.0.1");
    REQUIRE(cells[1] == "router");
    REQUIRE(cells[2] == "UP");
    REQUIRE(cells[3] == "4.3");
    REQUIRE(cells[4].size() == 8);
    REQUIRE(cells[5] == "3");
}

TEST_CASE("RowFormatter column widths follow the table", "[RowFormatter]") {
    auto now = Clock::now();
    StatusRecord status;
    const auto& titles = columnTitles();

    SECTION("Header is the minimum width") {
        auto widths = columnWidths({}, 200);
        for (std::size_t col = 0; col < kColumnCount; ++col) {
            REQUIRE(widths[col] == titles[col].size());
        }
    }

    SECTION("Longest address sets the host column") {
        std::vector<RowCells> rows{
            formatRow(Host{"webserver-01.prod.example.com", ""}, status, now),
            formatRow(Host{"webserver-01.prod.example.net", "edge"}, status, now),
            formatRow(Host{"1.1.1.1", ""}, status, now),
        };
        auto widths = columnWidths(rows, 200);
        REQUIRE(widths[0] == std::string("webserver-01.prod.example.com").size());
        REQUIRE(widths[1] == titles[1].size());

        REQUIRE(fitColumn(rows[0][0], widths[0]) != fitColumn(rows[1][0], widths[0]));
        REQUIRE(fitColumn(rows[0][0], widths[0]) == "webserver-01.prod.example.com");
    }

    SECTION("Narrow terminals shrink the description before the host") {
        std::vector<RowCells> rows{
            formatRow(Host{std::string(40, 'h'), std::string(30, 'd')}, status, now),
        };
        auto natural = columnWidths(rows, 1000);
        REQUIRE(natural[0] == 40);
        REQUIRE(natural[1] == 30);

        auto trimmed = columnWidths(rows, tableWidth(natural) - 10);
        REQUIRE(trimmed[0] == 40);
        REQUIRE(trimmed[1] == 20);
        REQUIRE(tableWidth(trimmed) == tableWidth(natural) - 10);

        auto tight = columnWidths(rows, tableWidth(natural) - 30);
        REQUIRE(tight[1] == titles[1].size());
        REQUIRE(tight[0] == 36);
        REQUIRE(tableWidth(tight) == tableWidth(natural) - 30);

        auto tiny = columnWidths(rows, 10);
        REQUIRE(tiny[0] == titles[0].size());
        REQUIRE(tiny[1] == titles[1].size());
        REQUIRE(tiny[2] == titles[2].size());
    }
}
