#include <allocsim/core/types.hpp>

#include <allocsim/io/csv_snapshot.hpp>
#include <allocsim/io/customer_master.hpp>
#include <allocsim/io/error.hpp>
#include <allocsim/io/period_label.hpp>
#include <allocsim/io/scenario_generation.hpp>
#include <allocsim/io/scenario_loader.hpp>

#include <cxxopts.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <string>

namespace {

namespace core = allocsim::core;
namespace io = allocsim::io;

struct Config {
    std::size_t weeks{30};
    core::Period first_week{202601};
    double probability{0.9};
    std::string master_file;
    std::string output_file{"-"};
    std::string csv_dir;
    std::optional<uint64_t> seed;
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("allocgen", "Supply and demand scenario generator");

    // clang-format off
    options.add_options()
        ("w,weeks", "Number of ISO weeks to cover (default: 30)",
            cxxopts::value<std::size_t>()->default_value("30"))
        ("first-period", "First week, YYYY-Www or YYYYWW (default: 2026-W01)",
            cxxopts::value<std::string>()->default_value("2026-W01"))
        ("p,probability", "Daily chance of each delivery or order [0,1] (default: 0.9)",
            cxxopts::value<double>()->default_value("0.9"))
        ("master", "Customer master (CSV, default: built-in table)", cxxopts::value<std::string>())
        ("o,output", "Scenario output file (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("csv-dir", "Also write timestamped CSV exports into this directory",
            cxxopts::value<std::string>())
        ("seed", "Random seed", cxxopts::value<uint64_t>())
        ("h,help", "Show help");
    // clang-format on

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    Config config;
    config.weeks = result["weeks"].as<std::size_t>();
    config.probability = result["probability"].as<double>();
    config.output_file = result["output"].as<std::string>();

    auto first = io::parse_period(result["first-period"].as<std::string>());
    if (!first) {
        std::cerr << "Error: --first-period must be YYYY-Www or YYYYWW" << std::endl;
        std::exit(64);
    }
    config.first_week = *first;

    if (result.count("master") != 0U) {
        config.master_file = result["master"].as<std::string>();
    }
    if (result.count("csv-dir") != 0U) {
        config.csv_dir = result["csv-dir"].as<std::string>();
    }
    if (result.count("seed") != 0U) {
        config.seed = result["seed"].as<uint64_t>();
    }

    // Validation
    if (config.weeks < 1) {
        std::cerr << "Error: weeks must be >= 1" << std::endl;
        std::exit(64);
    }

    if (config.probability < 0.0 || config.probability > 1.0) {
        std::cerr << "Error: probability must be in [0, 1]" << std::endl;
        std::exit(64);
    }

    return config;
}

// Export stamp in the upstream layout, e.g. 20260105_143000.
std::string current_stamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream stamp;
    stamp << std::put_time(&local, "%Y%m%d_%H%M%S");
    return stamp.str();
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        // Initialize RNG
        std::mt19937 rng;
        if (config.seed.has_value()) {
            rng.seed(static_cast<std::mt19937::result_type>(config.seed.value()));
        } else {
            std::random_device rd;
            rng.seed(rd());
        }

        io::GenerationParams params;
        params.weeks = config.weeks;
        params.first_week = config.first_week;
        params.daily_probability = config.probability;
        if (!config.master_file.empty()) {
            params.master = io::load_customer_master(config.master_file);
        }

        auto snapshot = io::generate_snapshot(params, rng);

        if (!config.csv_dir.empty()) {
            io::write_snapshot(snapshot, params.master, config.csv_dir, current_stamp());
            std::cerr << "Wrote " << snapshot.supply.size() << " deliveries and "
                      << snapshot.demand.size() << " order lines to " << config.csv_dir << std::endl;
        }

        auto scenario = io::build_scenario(snapshot, params.master);

        if (config.output_file == "-") {
            io::write_scenario_to_stream(scenario, std::cout);
        } else {
            std::ofstream outfile(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open file: " << config.output_file << std::endl;
                return 1;
            }
            io::write_scenario_to_stream(scenario, outfile);
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
