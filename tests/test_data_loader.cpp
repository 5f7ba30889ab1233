/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader and the run configuration
 */

#include <catch2/catch.hpp>
#include "data/data_loader.hpp"
#include "data/calendar.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>

using namespace stockmetrics;
using Catch::Matchers::WithinAbs;

namespace
{
    std::string write_temp_file(const std::string &name, const std::string &content)
    {
        auto path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }
}

TEST_CASE("CSV line parsing", "[DataLoader]")
{
    auto fields = DataLoader::parse_csv_line("AAPL,2020-01-02,74.06,75.15");
    REQUIRE(fields.size() == 4);
    REQUIRE(fields[0] == "AAPL");
    REQUIRE(fields[3] == "75.15");

    SECTION("Quoted fields keep commas and doubled quotes")
    {
        auto quoted = DataLoader::parse_csv_line("\"BRK,B\",\"say \"\"hi\"\"\",3");
        REQUIRE(quoted.size() == 3);
        REQUIRE(quoted[0] == "BRK,B");
        REQUIRE(quoted[1] == "say \"hi\"");
        REQUIRE(quoted[2] == "3");
    }

    SECTION("Quoting for output")
    {
        REQUIRE(DataLoader::quote_csv_field("AAPL") == "AAPL");
        REQUIRE(DataLoader::quote_csv_field("BRK,B") == "\"BRK,B\"");
        REQUIRE(DataLoader::quote_csv_field("a\"b") == "\"a\"\"b\"");

        auto line = DataLoader::quote_csv_field("x,\"y\"") + "," + DataLoader::quote_csv_field("z");
        auto fields2 = DataLoader::parse_csv_line(line);
        REQUIRE(fields2.size() == 2);
        REQUIRE(fields2[0] == "x,\"y\"");
        REQUIRE(fields2[1] == "z");
    }
}

TEST_CASE("Load panel from CSV", "[DataLoader]")
{
    SECTION("Canonical header")
    {
        auto path = write_temp_file("stockmetrics_panel.csv",
                                    "symbol,date,open,high,low,close,adjusted,volume\n"
                                    "MSFT,2020-01-03,158.3,159.9,158.1,158.6,155.2,21116200\n"
                                    "AAPL,2020-01-02,74.06,75.15,73.80,75.09,73.41,135480400\n"
                                    "AAPL,2020-01-03,74.29,75.14,74.13,74.36,72.70,146322800\n");

        auto panel = DataLoader::load_panel_csv(path);

        REQUIRE(panel.num_records() == 3);
        REQUIRE(panel.num_symbols() == 2);

        const auto &first = panel.records()[0];
        REQUIRE(first.symbol == "AAPL");
        REQUIRE(first.date == "2020-01-02");
        REQUIRE_THAT(first.open, WithinAbs(74.06, 1e-12));
        REQUIRE_THAT(first.adjusted, WithinAbs(73.41, 1e-12));
        REQUIRE_THAT(first.volume, WithinAbs(135480400.0, 1e-6));
    }

    SECTION("Aliased and reordered columns")
    {
        auto path = write_temp_file("stockmetrics_alias.csv",
                                    "Date,Ticker,Open,High,Low,Close,Adj Close,Volume\n"
                                    "2020-01-02,IBM,135.0,136.0,134.0,135.4,120.1,3148600\n");

        auto panel = DataLoader::load_panel_csv(path);

        REQUIRE(panel.num_records() == 1);
        REQUIRE(panel.records()[0].symbol == "IBM");
        REQUIRE_THAT(panel.records()[0].adjusted, WithinAbs(120.1, 1e-12));
    }

    SECTION("Symbol subset")
    {
        auto path = write_temp_file("stockmetrics_subset.csv",
                                    "symbol,date,open,high,low,close,adjusted,volume\n"
                                    "AAPL,2020-01-02,1,1,1,1,1,1\n"
                                    "MSFT,2020-01-02,2,2,2,2,2,2\n");

        auto panel = DataLoader::load_panel_csv(path, {"MSFT"});
        REQUIRE(panel.symbols() == std::vector<std::string>{"MSFT"});
    }

    SECTION("Short lines are skipped, unparsable numbers become null")
    {
        auto path = write_temp_file("stockmetrics_short.csv",
                                    "symbol,date,open,high,low,close,adjusted,volume\n"
                                    "AAPL,2020-01-02,1,1,1,1\n"
                                    "AAPL,2020-01-03,1,1,1,1,n/a,10\n");

        auto panel = DataLoader::load_panel_csv(path);
        REQUIRE(panel.num_records() == 1);
        REQUIRE(is_null(panel.records()[0].adjusted));
    }

    SECTION("Infinite numbers become null")
    {
        auto path = write_temp_file("stockmetrics_inf.csv",
                                    "symbol,date,open,high,low,close,adjusted,volume\n"
                                    "AAPL,2020-01-02,1,1,1,1,1,inf\n"
                                    "AAPL,2020-01-03,-inf,1,1,1,1e999,10\n");

        auto panel = DataLoader::load_panel_csv(path);
        REQUIRE(panel.num_records() == 2);
        REQUIRE(is_null(panel.records()[0].volume));
        REQUIRE(is_null(panel.records()[1].open));
        REQUIRE(is_null(panel.records()[1].adjusted));
    }

    SECTION("Quoted symbols")
    {
        auto path = write_temp_file("stockmetrics_quoted.csv",
                                    "symbol,date,open,high,low,close,adjusted,volume\n"
                                    "\"BRK,B\",2020-01-02,1,1,1,1,1,1\n");

        auto panel = DataLoader::load_panel_csv(path);
        REQUIRE(panel.symbols() == std::vector<std::string>{"BRK,B"});
    }
}

TEST_CASE("CSV schema errors", "[DataLoader]")
{
    SECTION("Missing column")
    {
        auto path = write_temp_file("stockmetrics_missing.csv",
                                    "symbol,date,open,high,low,close,volume\n"
                                    "AAPL,2020-01-02,1,1,1,1,1\n");
        REQUIRE_THROWS_AS(DataLoader::load_panel_csv(path), InvalidInputError);
    }

    SECTION("Duplicate key")
    {
        auto path = write_temp_file("stockmetrics_duplicate.csv",
                                    "symbol,date,open,high,low,close,adjusted,volume\n"
                                    "AAPL,2020-01-02,1,1,1,1,1,1\n"
                                    "AAPL,2020-01-02,2,2,2,2,2,2\n");
        REQUIRE_THROWS_AS(DataLoader::load_panel_csv(path), InvalidInputError);
    }

    SECTION("Malformed date")
    {
        auto path = write_temp_file("stockmetrics_baddate.csv",
                                    "symbol,date,open,high,low,close,adjusted,volume\n"
                                    "AAPL,02/01/2020,1,1,1,1,1,1\n");
        REQUIRE_THROWS_AS(DataLoader::load_panel_csv(path), InvalidInputError);
    }

    SECTION("Missing file")
    {
        REQUIRE_THROWS_AS(DataLoader::load_panel_csv("/nonexistent/prices.csv"), std::runtime_error);
    }
}

TEST_CASE("CSV export round trip", "[DataLoader]")
{
    auto panel = DataLoader::generate_synthetic_panel({"AAA", "BBB"}, 10);
    auto path = (std::filesystem::temp_directory_path() / "stockmetrics_roundtrip.csv").string();

    DataLoader::save_panel_csv(panel, path);
    auto loaded = DataLoader::load_panel_csv(path);

    REQUIRE(loaded.num_records() == panel.num_records());
    REQUIRE(loaded.symbols() == panel.symbols());
    REQUIRE(loaded.records().back().date == panel.records().back().date);
    REQUIRE_THAT(loaded.records().back().adjusted, WithinAbs(panel.records().back().adjusted, 1e-6));

    SECTION("Symbols with a comma survive")
    {
        auto odd = DataLoader::generate_synthetic_panel({"BRK,B"}, 3);
        DataLoader::save_panel_csv(odd, path);
        REQUIRE(DataLoader::load_panel_csv(path).symbols() == std::vector<std::string>{"BRK,B"});
    }
}

TEST_CASE("Run configuration", "[DataLoader][Config]")
{
    SECTION("Defaults")
    {
        auto config = MetricsConfig::defaults();
        REQUIRE(config.data.data_file == "data/market/daily_prices.csv");
        REQUIRE(config.data.universe.empty());
        REQUIRE(config.rolling.window == 30);
        REQUIRE(config.correlation.features.size() == 6);
        REQUIRE_FALSE(config.correlation.symbol_correlation);
        REQUIRE(config.output.directory == "results");
        REQUIRE(config.output.precision == 6);
    }

    SECTION("Values from JSON")
    {
        auto j = nlohmann::json::parse(R"({
            "data": {"start_date": "2020-01-01", "end_date": "2020-12-31", "universe": ["AAPL"]},
            "rolling": {"window": 20},
            "correlation": {"features": ["close", "volume"], "symbol_correlation": true},
            "output": {"directory": "out", "precision": 4}
        })");

        auto config = MetricsConfig::from_json(j);
        REQUIRE(config.data.start_date == "2020-01-01");
        REQUIRE(config.data.universe == std::vector<std::string>{"AAPL"});
        REQUIRE(config.rolling.window == 20);
        REQUIRE(config.correlation.features == std::vector<std::string>{"close", "volume"});
        REQUIRE(config.correlation.symbol_correlation);
        REQUIRE(config.output.directory == "out");
        REQUIRE(config.output.precision == 4);
    }

    SECTION("Invalid values are rejected")
    {
        using nlohmann::json;
        REQUIRE_THROWS_AS(MetricsConfig::from_json(json::parse(R"({"rolling": {"window": 1}})")),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(MetricsConfig::from_json(json::parse(R"({"correlation": {"features": ["beta"]}})")),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(MetricsConfig::from_json(json::parse(R"({"data": {"start_date": "2020-01-01"}})")),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(MetricsConfig::from_json(json::parse(R"({"output": {"precision": 30}})")),
                          std::invalid_argument);
    }

    SECTION("Fields overridden after loading are validated")
    {
        auto config = MetricsConfig::defaults();
        REQUIRE_NOTHROW(config.validate());

        config.rolling.window = 0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);

        config.rolling.window = 2;
        REQUIRE_NOTHROW(config.validate());

        config.correlation.features.push_back("beta");
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("From file")
    {
        auto path = write_temp_file("stockmetrics_config.json", R"({"rolling": {"window": 10}})");
        REQUIRE(DataLoader::load_config(path).rolling.window == 10);

        auto bad_type = write_temp_file("stockmetrics_bad_type.json", R"({"rolling": {"window": "ten"}})");
        REQUIRE_THROWS_AS(DataLoader::load_config(bad_type), std::invalid_argument);

        auto bad_json = write_temp_file("stockmetrics_bad.json", "{ not json");
        REQUIRE_THROWS_AS(DataLoader::load_config(bad_json), std::runtime_error);

        REQUIRE_THROWS_AS(MetricsConfig::load_from_file("/nonexistent/config.json"), std::runtime_error);
    }
}

TEST_CASE("Synthetic panel generation", "[DataLoader]")
{
    auto panel = DataLoader::generate_synthetic_panel({"AAA", "BBB", "CCC"}, 50, "2020-01-04", 0.02, 0.0005, 7);

    REQUIRE(panel.num_symbols() == 3);
    REQUIRE(panel.num_records() == 150);

    SECTION("Weekdays only, starting on the next weekday")
    {
        REQUIRE(panel.first_date() == "2020-01-06");
        for (const auto &record : panel.records())
        {
            REQUIRE(calendar::day_of_week(record.date) < 5);
        }
    }

    SECTION("Prices are positive and consistent")
    {
        for (const auto &record : panel.records())
        {
            REQUIRE(record.adjusted > 0.0);
            REQUIRE(record.high >= record.low);
            REQUIRE(record.volume > 0.0);
        }
    }

    SECTION("Reproducible from the seed")
    {
        auto again = DataLoader::generate_synthetic_panel({"AAA", "BBB", "CCC"}, 50, "2020-01-04", 0.02, 0.0005, 7);
        REQUIRE(again.records().back().adjusted == panel.records().back().adjusted);
    }

    SECTION("Invalid start date")
    {
        REQUIRE_THROWS_AS(DataLoader::generate_synthetic_panel({"AAA"}, 5, "2020-02-30"), std::invalid_argument);
    }
}
