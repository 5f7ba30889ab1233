/**
 * @file test_rolling_statistics.cpp
 * @brief Unit tests for RollingStatistics
 */

#include <catch2/catch.hpp>
#include "analytics/rolling_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

using namespace stockmetrics::analytics;
using Catch::Matchers::WithinAbs;

namespace
{
    const double NaN = std::numeric_limits<double>::quiet_NaN();

    std::vector<double> ramp(int n)
    {
        std::vector<double> v(n);
        std::iota(v.begin(), v.end(), 1.0);
        return v;
    }

    double sample_std(const std::vector<double> &v, size_t first, size_t count)
    {
        double mean = 0.0;
        for (size_t i = first; i < first + count; ++i)
            mean += v[i];
        mean /= static_cast<double>(count);

        double ss = 0.0;
        for (size_t i = first; i < first + count; ++i)
            ss += (v[i] - mean) * (v[i] - mean);
        return std::sqrt(ss / static_cast<double>(count - 1));
    }
}

TEST_CASE("RollingStatistics construction", "[RollingStatistics]")
{
    SECTION("Window below two is rejected")
    {
        REQUIRE_THROWS_AS(RollingStatistics(ramp(5), RollingConfig(1, WindowAlignment::TRAILING)),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(RollingStatistics(ramp(5), RollingConfig(0, WindowAlignment::CENTERED)),
                          std::invalid_argument);
    }

    SECTION("Config is kept")
    {
        RollingStatistics rs(ramp(5), RollingConfig(3, WindowAlignment::CENTERED));
        REQUIRE(rs.config().window_days == 3);
        REQUIRE(rs.config().alignment == WindowAlignment::CENTERED);
    }
}

TEST_CASE("Window bounds", "[RollingStatistics]")
{
    auto series = ramp(60);

    SECTION("Trailing covers the last 30 positions")
    {
        RollingStatistics rs(series, RollingConfig(30, WindowAlignment::TRAILING));
        REQUIRE(rs.window_bounds(29) == std::make_pair(0L, 29L));
        REQUIRE(rs.window_bounds(45) == std::make_pair(16L, 45L));
        REQUIRE_FALSE(rs.is_complete(28));
        REQUIRE(rs.is_complete(29));
    }

    SECTION("Centered covers 14 before and 15 after")
    {
        RollingStatistics rs(series, RollingConfig(30, WindowAlignment::CENTERED));
        REQUIRE(rs.window_bounds(14) == std::make_pair(0L, 29L));
        REQUIRE(rs.window_bounds(30) == std::make_pair(16L, 45L));
        REQUIRE_FALSE(rs.is_complete(13));
        REQUIRE(rs.is_complete(14));
        REQUIRE(rs.is_complete(44));
        REQUIRE_FALSE(rs.is_complete(45));
    }

    SECTION("Odd centered window is symmetric")
    {
        RollingStatistics rs(series, RollingConfig(5, WindowAlignment::CENTERED));
        REQUIRE(rs.window_bounds(10) == std::make_pair(8L, 12L));
    }
}

TEST_CASE("Rolling volatility", "[RollingStatistics]")
{
    std::vector<double> series = {0.5, -1.2, 2.3, 0.0, 1.1, -0.7, 3.4, -2.2, 0.9, 1.5};

    SECTION("Output has one value per input")
    {
        RollingStatistics rs(series, RollingConfig(4, WindowAlignment::TRAILING));
        REQUIRE(rs.volatility().size() == series.size());
    }

    SECTION("Trailing matches sample standard deviation")
    {
        RollingStatistics rs(series, RollingConfig(4, WindowAlignment::TRAILING));
        auto vol = rs.volatility();

        for (size_t t = 0; t < 3; ++t)
        {
            REQUIRE(std::isnan(vol[t]));
        }
        for (size_t t = 3; t < series.size(); ++t)
        {
            REQUIRE_THAT(vol[t], WithinAbs(sample_std(series, t - 3, 4), 1e-12));
        }
    }

    SECTION("Centered reports the same windows at earlier positions")
    {
        RollingStatistics trailing(series, RollingConfig(4, WindowAlignment::TRAILING));
        RollingStatistics centered(series, RollingConfig(4, WindowAlignment::CENTERED));
        auto tv = trailing.volatility();
        auto cv = centered.volatility();

        // W=4: centered window at t is [t-1, t+2], the trailing window at t+2
        REQUIRE(std::isnan(cv[0]));
        for (size_t t = 1; t + 2 < series.size(); ++t)
        {
            REQUIRE_THAT(cv[t], WithinAbs(tv[t + 2], 1e-12));
        }
        REQUIRE(std::isnan(cv[series.size() - 2]));
        REQUIRE(std::isnan(cv[series.size() - 1]));
    }

    SECTION("Thirty-day window over a ramp")
    {
        RollingStatistics rs(ramp(30), RollingConfig(30, WindowAlignment::TRAILING));
        auto vol = rs.volatility();
        // Sample variance of 1..n is n(n+1)/12
        REQUIRE_THAT(vol[29], WithinAbs(std::sqrt(30.0 * 31.0 / 12.0), 1e-10));
    }

    SECTION("Constant series has zero volatility")
    {
        RollingStatistics rs(std::vector<double>(8, 2.5), RollingConfig(3, WindowAlignment::TRAILING));
        auto vol = rs.volatility();
        REQUIRE_THAT(vol[2], WithinAbs(0.0, 1e-15));
        REQUIRE_THAT(vol[7], WithinAbs(0.0, 1e-15));
    }
}

TEST_CASE("Nulls poison every window they fall in", "[RollingStatistics]")
{
    auto series = ramp(10);
    series[4] = NaN;

    RollingStatistics rs(series, RollingConfig(3, WindowAlignment::TRAILING));
    auto mean = rs.mean();

    REQUIRE_THAT(mean[3], WithinAbs(3.0, 1e-12));
    REQUIRE(std::isnan(mean[4]));
    REQUIRE(std::isnan(mean[5]));
    REQUIRE(std::isnan(mean[6]));
    REQUIRE_THAT(mean[7], WithinAbs(7.0, 1e-12));
}

TEST_CASE("Series shorter than the window", "[RollingStatistics]")
{
    RollingStatistics rs(ramp(5), RollingConfig(30, WindowAlignment::CENTERED));
    for (double v : rs.volatility())
    {
        REQUIRE(std::isnan(v));
    }
}

TEST_CASE("Custom rolling function", "[RollingStatistics]")
{
    RollingStatistics rs(ramp(6), RollingConfig(3, WindowAlignment::TRAILING));
    auto maxima = rs.apply([](const std::vector<double> &w)
                           { return *std::max_element(w.begin(), w.end()); });

    REQUIRE(std::isnan(maxima[1]));
    REQUIRE(maxima[2] == 3.0);
    REQUIRE(maxima[5] == 6.0);
}
