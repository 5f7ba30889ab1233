/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Provides functionality to load the daily price panel from CSV files and
 * configuration from JSON files.
 */

#ifndef STOCKMETRICS_DATA_DATA_LOADER_HPP
#define STOCKMETRICS_DATA_DATA_LOADER_HPP

#include "price_panel.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace stockmetrics {

/**
 * @struct DataConfig
 * @brief Configuration parameters for data loading
 */
struct DataConfig {
    std::string data_file;                     ///< Path to the panel CSV
    std::string start_date;                    ///< Start date filter (empty = none)
    std::string end_date;                      ///< End date filter (empty = none)
    std::vector<std::string> universe;         ///< Symbols to keep (empty = all)

    static DataConfig from_json(const nlohmann::json& j);
    void validate() const;
};

/**
 * @struct WindowConfig
 * @brief Rolling window parameters
 */
struct WindowConfig {
    int window;                                ///< Window width in observations

    static WindowConfig from_json(const nlohmann::json& j);
    void validate() const;
};

/**
 * @struct CorrelationConfig
 * @brief Correlation engine parameters
 */
struct CorrelationConfig {
    std::vector<std::string> features;         ///< Feature columns, in output order
    bool symbol_correlation;                   ///< Also correlate daily returns across symbols

    static CorrelationConfig from_json(const nlohmann::json& j);
    void validate() const;
};

/**
 * @struct OutputConfig
 * @brief Where and how output tables are written
 */
struct OutputConfig {
    std::string directory;                     ///< Output directory
    int precision;                             ///< Decimal places in CSV output

    static OutputConfig from_json(const nlohmann::json& j);
    void validate() const;
};

/**
 * @struct MetricsConfig
 * @brief Complete run configuration
 */
struct MetricsConfig {
    DataConfig data;
    WindowConfig rolling;
    CorrelationConfig correlation;
    OutputConfig output;

    /**
     * @brief Configuration with every default applied
     */
    static MetricsConfig defaults();

    /**
     * @brief Build from a parsed JSON document; missing sections take defaults
     * @throws std::invalid_argument on out-of-range values
     */
    static MetricsConfig from_json(const nlohmann::json& j);

    /**
     * @brief Check every section; call again after overriding fields in code
     * @throws std::invalid_argument on the first out-of-range value
     */
    void validate() const;

    /**
     * @brief Load complete configuration from JSON file
     */
    static MetricsConfig load_from_file(const std::string& config_path);
};

/**
 * @class DataLoader
 * @brief Loads and writes the daily price panel
 *
 * Expected CSV layout (long format, one row per symbol and date):
 * symbol,date,open,high,low,close,adjusted,volume
 * AAPL,2020-01-02,74.06,75.15,73.80,75.09,73.41,135480400
 *
 * Column order is free and names are case-insensitive. "ticker" is
 * accepted for symbol, "adj_close"/"adjusted_close" for adjusted.
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load the price panel from a CSV file
     * @param filepath Path to CSV file
     * @param symbols Optional list of symbols to load (loads all if empty)
     * @return Validated PricePanel
     * @throws std::runtime_error if file cannot be opened
     * @throws InvalidInputError on missing columns, duplicate keys or
     *         malformed dates
     */
    static PricePanel load_panel_csv(const std::string& filepath,
                                     const std::vector<std::string>& symbols = {});

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON file
     * @throws std::runtime_error if file cannot be loaded or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load complete run configuration
     */
    static MetricsConfig load_config(const std::string& config_path);

    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================

    /**
     * @brief Generate a synthetic OHLCV panel on weekdays
     * @param symbols List of symbols
     * @param num_days Number of trading days per symbol
     * @param start_date First calendar date (moved to a weekday if needed)
     * @param volatility Daily volatility (default 0.02)
     * @param drift Daily drift (default 0.0005)
     * @param seed Random seed, for reproducible panels
     */
    static PricePanel generate_synthetic_panel(
        const std::vector<std::string>& symbols,
        size_t num_days,
        const std::string& start_date = "2020-01-02",
        double volatility = 0.02,
        double drift = 0.0005,
        std::uint32_t seed = 42
    );

    // ========================================================================
    // Export Methods
    // ========================================================================

    /**
     * @brief Save a price panel to CSV in the layout load_panel_csv reads
     */
    static void save_panel_csv(const PricePanel& panel, const std::string& filepath);

    /**
     * @brief Parse CSV line into tokens
     */
    static std::vector<std::string> parse_csv_line(const std::string& line);

    /**
     * @brief Quote a text cell for CSV output
     *
     * Fields containing a comma, quote or line break are wrapped in quotes,
     * with embedded quotes doubled. Other fields are returned unchanged.
     */
    static std::string quote_csv_field(const std::string& field);

private:
    // ========================
    // Private Helper Methods
    // ========================

    /**
     * @brief Trim whitespace from string
     */
    static std::string trim(const std::string& str);

    /**
     * @brief Lower-case a header name and map aliases to canonical names
     */
    static std::string canonical_column(const std::string& header);

    /**
     * @brief Convert string to double safely
     * @return Double value, or NaN if conversion fails or the value is infinite
     */
    static double safe_stod(const std::string& str);
};

} // namespace stockmetrics

#endif // STOCKMETRICS_DATA_DATA_LOADER_HPP
