/**
 * @file generate_synthetic_data.cpp
 * @brief Generate a synthetic daily OHLCV panel for Stock Metrics
 */

#include "data/data_loader.hpp"
#include "data/price_panel.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace stockmetrics;

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Panel Generator ===\n" << std::endl;

    std::vector<std::string> symbols = {
        "AAPL",   // Apple - Tech
        "MSFT",   // Microsoft - Tech
        "JPM",    // JPMorgan - Finance
        "JNJ",    // Johnson & Johnson - Healthcare
        "XOM"     // Exxon Mobil - Energy
    };

    std::string output_file = "data/market/daily_prices.csv";
    std::string start_date = "2019-01-02";
    size_t num_days = 1260;          // ~5 years of trading days
    double volatility = 0.015;       // 1.5% daily volatility
    double drift = 0.0003;           // ~8% annualized return
    unsigned long seed = 42;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--output" && i + 1 < argc) {
                output_file = argv[++i];
            } else if (arg == "--symbols" && i + 1 < argc) {
                symbols = DataLoader::parse_csv_line(argv[++i]);
            } else if (arg == "--days" && i + 1 < argc) {
                num_days = std::stoul(argv[++i]);
            } else if (arg == "--start" && i + 1 < argc) {
                start_date = argv[++i];
            } else if (arg == "--volatility" && i + 1 < argc) {
                volatility = std::stod(argv[++i]);
            } else if (arg == "--drift" && i + 1 < argc) {
                drift = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoul(argv[++i]);
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --output FILE      Output CSV file (default: data/market/daily_prices.csv)\n"
                          << "  --symbols A,B,C    Comma-separated symbols (default: AAPL,MSFT,JPM,JNJ,XOM)\n"
                          << "  --days N           Trading days per symbol (default: 1260)\n"
                          << "  --start DATE       First date, YYYY-MM-DD (default: 2019-01-02)\n"
                          << "  --volatility VAL   Daily volatility (default: 0.015)\n"
                          << "  --drift VAL        Daily drift (default: 0.0003)\n"
                          << "  --seed N           Random seed (default: 42)\n"
                          << "  --help             Show this help\n";
                return 0;
            } else {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        std::cout << "Generating " << num_days << " trading days for "
                  << symbols.size() << " symbols from " << start_date << "..." << std::endl;

        auto panel = DataLoader::generate_synthetic_panel(
            symbols,
            num_days,
            start_date,
            volatility,
            drift,
            static_cast<std::uint32_t>(seed)
        );

        auto parent = std::filesystem::path(output_file).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        std::cout << "Saving to " << output_file << "..." << std::endl;
        DataLoader::save_panel_csv(panel, output_file);

        panel.print_summary();
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Data generation complete.\n" << std::endl;
    std::cout << "You can now run:\n";
    std::cout << "  ./build/stock_metrics --config data/config/metrics_config.json --verbose\n";
    std::cout << std::endl;

    return 0;
}
