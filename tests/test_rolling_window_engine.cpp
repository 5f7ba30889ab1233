/**
 * @file test_rolling_window_engine.cpp
 * @brief Unit tests for RollingWindowEngine
 */

#include <catch2/catch.hpp>
#include "analytics/rolling_window_engine.hpp"
#include "test_fixtures.hpp"

#include <cmath>

using namespace stockmetrics;
using namespace stockmetrics::analytics;
using stockmetrics::testing::make_series;
using Catch::Matchers::WithinAbs;

namespace
{
    std::vector<double> zigzag(int n, double low, double high)
    {
        std::vector<double> prices;
        for (int i = 0; i < n; ++i)
        {
            prices.push_back(i % 2 == 0 ? low : high);
        }
        return prices;
    }
}

TEST_CASE("RollingWindowEngine construction", "[RollingWindowEngine]")
{
    REQUIRE(RollingWindowEngine().window_days() == 30);
    REQUIRE(RollingWindowEngine(5).window_days() == 5);
    REQUIRE_THROWS_AS(RollingWindowEngine(1), std::invalid_argument);
}

TEST_CASE("Constant price has zero trailing volatility once the window fills", "[RollingWindowEngine]")
{
    auto derived = testing::derive(make_series("FLAT", "2020-01-06", std::vector<double>(40, 100.0)));

    RollingWindowEngine engine;
    auto stats = engine.compute(derived, WindowAlignment::TRAILING);

    REQUIRE(stats.size() == 40);
    // Row 0 has a null return, so the first clean 30-row window ends at row 30
    for (size_t t = 0; t < 30; ++t)
    {
        REQUIRE(is_null(stats[t].rolling_volatility));
    }
    for (size_t t = 30; t < 40; ++t)
    {
        REQUIRE_THAT(stats[t].rolling_volatility, WithinAbs(0.0, 1e-15));
    }
}

TEST_CASE("Rolling volume is a trailing mean", "[RollingWindowEngine]")
{
    auto records = make_series("X", "2020-01-06", std::vector<double>(6, 10.0));
    for (size_t i = 0; i < records.size(); ++i)
    {
        records[i].volume = 100.0 * static_cast<double>(i + 1);
    }

    RollingWindowEngine engine(3);

    SECTION("Independent of the volatility alignment")
    {
        auto trailing = engine.compute(testing::derive(records), WindowAlignment::TRAILING);
        auto centered = engine.compute(testing::derive(records), WindowAlignment::CENTERED);

        REQUIRE(is_null(trailing[1].rolling_volume));
        REQUIRE_THAT(trailing[2].rolling_volume, WithinAbs(200.0, 1e-12));
        REQUIRE_THAT(trailing[5].rolling_volume, WithinAbs(500.0, 1e-12));
        for (size_t i = 0; i < trailing.size(); ++i)
        {
            if (is_null(trailing[i].rolling_volume))
            {
                REQUIRE(is_null(centered[i].rolling_volume));
            }
            else
            {
                REQUIRE(centered[i].rolling_volume == trailing[i].rolling_volume);
            }
        }
    }
}

TEST_CASE("Windows never span two symbols", "[RollingWindowEngine]")
{
    auto records = make_series("A", "2020-01-06", zigzag(4, 10.0, 11.0));
    auto b = make_series("B", "2020-01-06", zigzag(4, 50.0, 55.0));
    records.insert(records.end(), b.begin(), b.end());

    RollingWindowEngine engine(3);
    auto stats = engine.compute(testing::derive(records), WindowAlignment::TRAILING);

    REQUIRE(stats.size() == 8);
    REQUIRE(stats[4].symbol == "B");
    // B's first three rows cannot see A's tail
    REQUIRE(is_null(stats[4].rolling_volatility));
    REQUIRE(is_null(stats[5].rolling_volatility));
    REQUIRE(is_null(stats[6].rolling_volatility));
    REQUIRE_FALSE(is_null(stats[7].rolling_volatility));
}

TEST_CASE("Yearly volatility summary", "[RollingWindowEngine]")
{
    auto records = make_series("X", "2020-06-01", zigzag(40, 100.0, 102.0));
    auto next_year = make_series("X", "2021-01-04", zigzag(10, 100.0, 102.0));
    records.insert(records.end(), next_year.begin(), next_year.end());

    RollingWindowEngine engine;
    auto summary = engine.yearly_volatility(testing::derive(records));

    REQUIRE(summary.size() == 2);

    SECTION("Year with enough days has a summary")
    {
        REQUIRE(summary[0].year == 2020);
        REQUIRE_FALSE(is_null(summary[0].avg_volatility));
        REQUIRE(summary[0].avg_volatility > 0.0);
        REQUIRE(summary[0].max_volatility >= summary[0].avg_volatility);
    }

    SECTION("Year shorter than the window is null")
    {
        REQUIRE(summary[1].year == 2021);
        REQUIRE(is_null(summary[1].avg_volatility));
        REQUIRE(is_null(summary[1].max_volatility));
    }
}

TEST_CASE("summarize_volatility ignores null values", "[RollingWindowEngine]")
{
    std::vector<RollingStat> stats = {
        {"X", "2020-01-02", null_value(), 1.0},
        {"X", "2020-01-03", 1.0, 1.0},
        {"X", "2020-01-06", 3.0, 1.0},
        {"X", "2021-01-04", null_value(), 1.0}};

    auto summary = RollingWindowEngine::summarize_volatility(stats);

    REQUIRE(summary.size() == 2);
    REQUIRE_THAT(summary[0].avg_volatility, WithinAbs(2.0, 1e-12));
    REQUIRE_THAT(summary[0].max_volatility, WithinAbs(3.0, 1e-12));
    REQUIRE(is_null(summary[1].avg_volatility));
}

TEST_CASE("Yearly volume summary", "[RollingWindowEngine]")
{
    auto records = make_series("X", "2020-12-29", {10.0, 10.0, 10.0, 10.0});
    records[0].volume = 100.0; // 2020-12-29
    records[1].volume = 300.0; // 2020-12-30
    records[2].volume = 200.0; // 2020-12-31
    records[3].volume = 50.0;  // 2021-01-01

    auto summary = RollingWindowEngine::yearly_volume(testing::derive(records));

    REQUIRE(summary.size() == 2);
    REQUIRE(summary[0].year == 2020);
    REQUIRE_THAT(summary[0].avg_volume, WithinAbs(200.0, 1e-12));
    REQUIRE_THAT(summary[0].max_volume, WithinAbs(300.0, 1e-12));
    REQUIRE(summary[1].year == 2021);
    REQUIRE_THAT(summary[1].avg_volume, WithinAbs(50.0, 1e-12));
}
