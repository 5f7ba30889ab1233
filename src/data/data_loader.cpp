/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include "data/calendar.hpp"
#include "correlation/correlation_engine.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <random>
#include <set>

namespace stockmetrics
{

    namespace
    {
        const std::array<const char *, 8> REQUIRED_COLUMNS = {
            "symbol", "date", "open", "high", "low", "close", "adjusted", "volume"};
    }

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.data_file = j.value("data_file", "data/market/daily_prices.csv");
        config.start_date = j.value("start_date", "");
        config.end_date = j.value("end_date", "");
        config.universe = j.value("universe", std::vector<std::string>{});
        config.validate();
        return config;
    }

    void DataConfig::validate() const
    {
        if (start_date.empty() != end_date.empty())
        {
            throw std::invalid_argument("start_date and end_date must be given together");
        }
    }

    WindowConfig WindowConfig::from_json(const nlohmann::json &j)
    {
        WindowConfig config;
        config.window = j.value("window", 30);
        config.validate();
        return config;
    }

    void WindowConfig::validate() const
    {
        if (window < 2)
        {
            throw std::invalid_argument("Rolling window must be >= 2, got: " + std::to_string(window));
        }
    }

    CorrelationConfig CorrelationConfig::from_json(const nlohmann::json &j)
    {
        CorrelationConfig config;
        std::vector<std::string> defaults;
        for (auto feature : correlation::all_features())
        {
            defaults.push_back(correlation::feature_name(feature));
        }

        config.features = j.value("features", defaults);
        config.symbol_correlation = j.value("symbol_correlation", false);
        config.validate();
        return config;
    }

    void CorrelationConfig::validate() const
    {
        // Unknown names fail here, not mid-run
        for (const auto &name : features)
        {
            correlation::parse_feature(name);
        }
    }

    OutputConfig OutputConfig::from_json(const nlohmann::json &j)
    {
        OutputConfig config;
        config.directory = j.value("directory", "results");
        config.precision = j.value("precision", 6);
        config.validate();
        return config;
    }

    void OutputConfig::validate() const
    {
        if (precision < 0 || precision > 17)
        {
            throw std::invalid_argument("Output precision must be in [0, 17], got: " + std::to_string(precision));
        }
    }

    MetricsConfig MetricsConfig::defaults()
    {
        return from_json(nlohmann::json::object());
    }

    MetricsConfig MetricsConfig::from_json(const nlohmann::json &j)
    {
        const nlohmann::json empty = nlohmann::json::object();

        MetricsConfig config;
        config.data = DataConfig::from_json(j.contains("data") ? j["data"] : empty);
        config.rolling = WindowConfig::from_json(j.contains("rolling") ? j["rolling"] : empty);
        config.correlation = CorrelationConfig::from_json(j.contains("correlation") ? j["correlation"] : empty);
        config.output = OutputConfig::from_json(j.contains("output") ? j["output"] : empty);
        return config;
    }

    void MetricsConfig::validate() const
    {
        data.validate();
        rolling.validate();
        correlation.validate();
        output.validate();
    }

    MetricsConfig MetricsConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    // ===========================
    // CSV Loading
    // ===========================

    PricePanel DataLoader::load_panel_csv(const std::string &filepath,
                                          const std::vector<std::string> &symbols)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw InvalidInputError("Empty CSV file: " + filepath);
        }

        // Map canonical column name -> field index
        auto header = parse_csv_line(line);
        std::map<std::string, size_t> columns;
        for (size_t i = 0; i < header.size(); ++i)
        {
            columns[canonical_column(header[i])] = i;
        }

        for (const char *required : REQUIRED_COLUMNS)
        {
            if (columns.count(required) == 0)
            {
                throw InvalidInputError(std::string("Missing required column '") + required + "' in " + filepath);
            }
        }

        size_t max_index = 0;
        for (const char *required : REQUIRED_COLUMNS)
        {
            max_index = std::max(max_index, columns[required]);
        }

        std::set<std::string> wanted(symbols.begin(), symbols.end());
        std::vector<PricePoint> records;
        size_t line_number = 1;
        size_t skipped = 0;

        while (std::getline(file, line))
        {
            ++line_number;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() <= max_index)
            {
                std::cerr << "Warning: skipping line " << line_number << " of " << filepath
                          << " (expected " << header.size() << " fields, got " << fields.size() << ")" << std::endl;
                ++skipped;
                continue;
            }

            PricePoint record;
            record.symbol = trim(fields[columns["symbol"]]);
            if (!wanted.empty() && wanted.count(record.symbol) == 0)
            {
                continue;
            }

            record.date = trim(fields[columns["date"]]);
            record.open = safe_stod(fields[columns["open"]]);
            record.high = safe_stod(fields[columns["high"]]);
            record.low = safe_stod(fields[columns["low"]]);
            record.close = safe_stod(fields[columns["close"]]);
            record.adjusted = safe_stod(fields[columns["adjusted"]]);
            record.volume = safe_stod(fields[columns["volume"]]);

            records.push_back(record);
        }

        file.close();

        if (records.empty())
        {
            throw InvalidInputError("No valid data found in CSV file: " + filepath);
        }

        if (skipped > 0)
        {
            std::cerr << "Warning: " << skipped << " malformed line(s) skipped in " << filepath << std::endl;
        }

        return PricePanel(std::move(records));
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        file.close();
        return j;
    }

    MetricsConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);
        try
        {
            return MetricsConfig::from_json(j);
        }
        catch (const nlohmann::json::type_error &e)
        {
            throw std::invalid_argument("Invalid configuration in " + config_path + ": " + e.what());
        }
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    PricePanel DataLoader::generate_synthetic_panel(
        const std::vector<std::string> &symbols,
        size_t num_days,
        const std::string &start_date,
        double volatility,
        double drift,
        std::uint32_t seed)
    {
        if (!calendar::is_valid_date(start_date))
        {
            throw std::invalid_argument("Invalid start date: " + start_date);
        }

        std::mt19937 gen(seed);
        std::normal_distribution<double> returns_dist(drift, volatility);
        std::normal_distribution<double> noise_dist(0.0, volatility / 2.0);
        std::lognormal_distribution<double> volume_dist(std::log(1.0e6), 0.35);

        // Trading calendar: weekdays from start_date
        std::vector<std::string> dates;
        dates.reserve(num_days);
        std::string date = start_date;
        if (calendar::day_of_week(date) >= 5)
        {
            date = calendar::next_weekday(date);
        }
        for (size_t i = 0; i < num_days; ++i)
        {
            dates.push_back(date);
            date = calendar::next_weekday(date);
        }

        std::vector<PricePoint> records;
        records.reserve(num_days * symbols.size());

        // Geometric Brownian motion on the close; OHL scattered around it
        for (const auto &symbol : symbols)
        {
            double close = 100.0;
            for (size_t i = 0; i < num_days; ++i)
            {
                double previous_close = close;
                if (i > 0)
                {
                    close = previous_close * (1.0 + returns_dist(gen));
                }

                PricePoint record;
                record.symbol = symbol;
                record.date = dates[i];
                record.close = close;
                record.adjusted = close;
                record.open = previous_close * (1.0 + noise_dist(gen));
                record.high = std::max(record.open, close) * (1.0 + std::abs(noise_dist(gen)));
                record.low = std::min(record.open, close) * (1.0 - std::abs(noise_dist(gen)));
                record.volume = std::round(volume_dist(gen));
                records.push_back(record);
            }
        }

        return PricePanel(std::move(records));
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_panel_csv(const PricePanel &panel, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "symbol,date,open,high,low,close,adjusted,volume\n";

        for (const auto &record : panel.records())
        {
            file << quote_csv_field(record.symbol) << "," << record.date << ","
                 << std::fixed << std::setprecision(6)
                 << record.open << "," << record.high << ","
                 << record.low << "," << record.close << ","
                 << record.adjusted << ","
                 << std::setprecision(0) << record.volume << "\n";
        }

        file.close();
    }

    // =======================
    // Private Helper Methods
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (size_t i = 0; i < line.size(); ++i)
        {
            char c = line[i];
            if (c == '"')
            {
                // A doubled quote inside a quoted field is a literal quote
                if (in_quotes && i + 1 < line.size() && line[i + 1] == '"')
                {
                    token += '"';
                    ++i;
                }
                else
                {
                    in_quotes = !in_quotes;
                }
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else if (c != '\r')
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::quote_csv_field(const std::string &field)
    {
        if (field.find_first_of(",\"\r\n") == std::string::npos)
        {
            return field;
        }

        std::string quoted = "\"";
        for (char c : field)
        {
            if (c == '"')
            {
                quoted += '"';
            }
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    std::string DataLoader::canonical_column(const std::string &header)
    {
        std::string name = trim(header);
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c)
                       { return std::tolower(c); });

        if (name == "ticker")
            return "symbol";
        if (name == "adj_close" || name == "adjusted_close" || name == "adj close")
            return "adjusted";
        return name;
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN" || trimmed == "NA")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        try
        {
            size_t consumed = 0;
            double value = std::stod(trimmed, &consumed);
            if (consumed != trimmed.size() || !std::isfinite(value))
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return value;
        }
        catch (const std::invalid_argument &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::out_of_range &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

} // namespace stockmetrics
