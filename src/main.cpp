/**
 * @file main.cpp
 * @brief Main entry point for Stock Metrics
 *
 * Command-line application that loads configuration and the daily price
 * panel, computes returns, periodic bars, rolling statistics and
 * correlations, and writes the output tables.
 */

#include "analytics/metrics_pipeline.hpp"
#include "data/data_loader.hpp"
#include "data/price_panel.hpp"
#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace stockmetrics;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "stock_metrics 1.0.0: daily panel returns, rolling risk and correlation\n\n"
              << "Usage: " << program_name << " --config PATH [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH           Run configuration (JSON)\n"
              << "  --output DIR            Write tables to DIR instead of output.directory\n"
              << "  --window N              Rolling window width, overrides rolling.window\n"
              << "  --symbol-correlation    Also correlate daily returns across symbols\n"
              << "  --verbose, -v           Print per-stage detail\n"
              << "  --help, -h              Show this message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/metrics_config.json --output results -v\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Stock Metrics v1.0.0                                     \n"
              << "       Returns, Rolling Risk and Correlation for Price Panels   \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Options given on the command line; unset ones defer to the config file
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string output_dir;
    std::optional<int> window_override;
    bool symbol_correlation = false;
    bool verbose = false;
    bool show_help = false;
    std::vector<std::string> errors;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        auto value_of = [&](int &i, const std::string &flag) -> std::string
        {
            if (i + 1 >= argc)
            {
                args.errors.push_back(flag + " requires a value");
                return "";
            }
            return argv[++i];
        };

        for (int i = 1; i < argc; ++i)
        {
            const std::string flag = argv[i];

            if (flag == "--help" || flag == "-h")
                args.show_help = true;
            else if (flag == "--verbose" || flag == "-v")
                args.verbose = true;
            else if (flag == "--symbol-correlation")
                args.symbol_correlation = true;
            else if (flag == "--config")
                args.config_path = value_of(i, flag);
            else if (flag == "--output")
                args.output_dir = value_of(i, flag);
            else if (flag == "--window")
            {
                std::string value = value_of(i, flag);
                try
                {
                    if (!value.empty())
                        args.window_override = std::stoi(value);
                }
                catch (const std::exception &)
                {
                    args.errors.push_back("--window expects an integer, got '" + value + "'");
                }
            }
            else
                std::cerr << "Warning: ignoring unrecognized option " << flag << std::endl;
        }

        if (!args.show_help && args.config_path.empty())
        {
            args.errors.push_back("--config is required");
        }
        return args;
    }

    /**
     * @brief Fold command-line overrides into the loaded configuration
     */
    void apply_to(MetricsConfig &config) const
    {
        if (!output_dir.empty())
            config.output.directory = output_dir;
        if (window_override)
            config.rolling.window = *window_override;
        if (symbol_correlation)
            config.correlation.symbol_correlation = true;
        config.validate();
    }
};

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/6] Loading configuration..." << std::endl;

        auto config = DataLoader::load_config(args.config_path);
        args.apply_to(config);

        if (args.verbose)
        {
            std::cout << "  - Data file: " << config.data.data_file << "\n";
            std::cout << "  - Universe: ";
            if (config.data.universe.empty())
            {
                std::cout << "(all)";
            }
            for (const auto &symbol : config.data.universe)
            {
                std::cout << symbol << " ";
            }
            std::cout << "\n  - Rolling window: " << config.rolling.window << "\n";
            std::cout << "  - Symbol correlation: "
                      << (config.correlation.symbol_correlation ? "Yes" : "No") << "\n";
        }

        // ====================================================================
        // 2. Load Price Panel
        // ====================================================================
        std::cout << "[2/6] Loading price panel..." << std::endl;

        auto panel = DataLoader::load_panel_csv(config.data.data_file, config.data.universe);

        if (!config.data.start_date.empty() && !config.data.end_date.empty())
        {
            panel = panel.filter_by_date(config.data.start_date, config.data.end_date);
        }

        std::cout << "  - Loaded " << panel.num_records() << " records, "
                  << panel.num_symbols() << " symbols" << std::endl;

        if (args.verbose)
        {
            panel.print_summary();
        }

        // ====================================================================
        // 3-5. Returns, Periodic Bars, Rolling Windows, Correlation
        // ====================================================================
        auto pipeline = analytics::MetricsPipeline::from_config(config);

        std::cout << "[3/6] Calculating returns and periodic bars..." << std::endl;
        std::cout << "[4/6] Computing rolling statistics (window = "
                  << pipeline.window_days() << ")..." << std::endl;
        std::cout << "[5/6] Computing correlations..." << std::endl;

        auto report = pipeline.run(panel);

        if (!report.issues.empty())
        {
            std::cerr << "Warning: " << report.issues.size()
                      << " row(s) excluded for invalid prices" << std::endl;
        }

        report.print_summary(args.verbose);

        // ====================================================================
        // 6. Export
        // ====================================================================
        std::cout << "[6/6] Writing tables to " << config.output.directory << "..." << std::endl;

        auto files = report.export_to_csv(config.output.directory, config.output.precision);
        if (args.verbose)
        {
            for (const auto &file : files)
            {
                std::cout << "  - " << file << "\n";
            }
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Metrics completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    const auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help)
    {
        print_usage(argv[0]);
        return 0;
    }
    if (!args.errors.empty())
    {
        for (const auto &error : args.errors)
            std::cerr << "Error: " << error << "\n";
        std::cerr << "Run '" << argv[0] << " --help' for usage." << std::endl;
        return 1;
    }

    print_banner();
    return run(args);
}
