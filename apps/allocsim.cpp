#include <allocsim/core/error.hpp>
#include <allocsim/core/report_sink.hpp>

#include <allocsim/algo/allocation_engine.hpp>
#include <allocsim/algo/run_auditor.hpp>

#include <allocsim/io/csv_snapshot.hpp>
#include <allocsim/io/customer_master.hpp>
#include <allocsim/io/engine_config.hpp>
#include <allocsim/io/error.hpp>
#include <allocsim/io/metrics.hpp>
#include <allocsim/io/period_label.hpp>
#include <allocsim/io/report_sinks.hpp>
#include <allocsim/io/scenario_loader.hpp>

#include <cxxopts.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace {

namespace core = allocsim::core;
namespace algo = allocsim::algo;
namespace io = allocsim::io;

constexpr int EXIT_INPUT_ERROR = 1;
constexpr int EXIT_COMPUTATION_ERROR = 2;
constexpr int EXIT_AUDIT_FAILURE = 3;
constexpr int EXIT_USAGE = 64;

struct Config {
    std::string scenario_file;
    std::string supply_csv;
    std::string demand_csv;
    std::string master_file;
    std::string snapshot_dir;
    std::string config_file;
    std::string output_file{"-"};
    std::string format{"json"};
    std::string summary_file;
    bool no_lookahead{false};
    bool carry_reservation{false};
    bool metrics{false};
    bool audit{false};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("allocsim", "Constrained supply allocation engine");

    // clang-format off
    options.add_options()
        ("i,input", "Scenario file (JSON)", cxxopts::value<std::string>())
        ("supply-csv", "Supply export (CSV)", cxxopts::value<std::string>())
        ("demand-csv", "Demand export (CSV)", cxxopts::value<std::string>())
        ("master", "Customer master (CSV)", cxxopts::value<std::string>())
        ("snapshot-dir", "Directory holding the latest supply/demand exports",
            cxxopts::value<std::string>())
        ("c,config", "Engine configuration (JSON)", cxxopts::value<std::string>())
        ("o,output", "Report output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Format: json|csv|text|null (default: json)",
            cxxopts::value<std::string>()->default_value("json"))
        ("summary", "Per-period summary CSV (csv format only)", cxxopts::value<std::string>())
        ("no-lookahead", "Disable the lookahead reservation")
        ("carry-reservation", "Release reserved units into the next period")
        ("metrics", "Print metrics to stderr")
        ("audit", "Check the run's invariants, exit 3 on violation")
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");
    // clang-format on

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    Config config;
    auto optional_string = [&result](const char* name, std::string& target) {
        if (result.count(name) != 0U) {
            target = result[name].as<std::string>();
        }
    };
    optional_string("input", config.scenario_file);
    optional_string("supply-csv", config.supply_csv);
    optional_string("demand-csv", config.demand_csv);
    optional_string("master", config.master_file);
    optional_string("snapshot-dir", config.snapshot_dir);
    optional_string("config", config.config_file);
    optional_string("summary", config.summary_file);
    config.output_file = result["output"].as<std::string>();
    config.format = result["format"].as<std::string>();
    config.no_lookahead = result.count("no-lookahead") != 0U;
    config.carry_reservation = result.count("carry-reservation") != 0U;
    config.metrics = result.count("metrics") != 0U;
    config.audit = result.count("audit") != 0U;
    config.verbose = result.count("verbose") != 0U;

    int sources = (config.scenario_file.empty() ? 0 : 1) +
                  (config.supply_csv.empty() && config.demand_csv.empty() ? 0 : 1) +
                  (config.snapshot_dir.empty() ? 0 : 1);
    if (sources != 1) {
        std::cerr << "Error: exactly one of --input, --supply-csv/--demand-csv or --snapshot-dir "
                     "is required" << std::endl;
        std::exit(EXIT_USAGE);
    }
    if (config.supply_csv.empty() != config.demand_csv.empty()) {
        std::cerr << "Error: --supply-csv and --demand-csv go together" << std::endl;
        std::exit(EXIT_USAGE);
    }
    if (config.format != "json" && config.format != "csv" && config.format != "text" &&
        config.format != "null") {
        std::cerr << "Error: --format must be json, csv, text or null" << std::endl;
        std::exit(EXIT_USAGE);
    }
    if (!config.summary_file.empty() && config.format != "csv") {
        std::cerr << "Error: --summary requires --format csv" << std::endl;
        std::exit(EXIT_USAGE);
    }

    return config;
}

// Master data: --master, then the config file, then the snapshot directory.
std::optional<io::CustomerMaster> resolve_master(const Config& config, io::EngineConfig& engine_config) {
    if (!config.master_file.empty()) {
        return io::load_customer_master(config.master_file);
    }
    if (engine_config.customers) {
        return std::move(engine_config.customers);
    }
    if (!config.snapshot_dir.empty()) {
        auto path = std::filesystem::path(config.snapshot_dir) / std::string(io::MASTER_FILE_NAME);
        if (std::filesystem::exists(path)) {
            return io::load_customer_master(path);
        }
    }
    return std::nullopt;
}

io::ScenarioData load_input(const Config& config, const std::optional<io::CustomerMaster>& master) {
    if (!config.scenario_file.empty()) {
        if (config.verbose) {
            std::cerr << "Loading scenario from: " << config.scenario_file << std::endl;
        }
        return io::load_scenario(config.scenario_file, master ? &*master : nullptr);
    }

    if (!master) {
        throw io::LoaderError("CSV input needs a customer master (--master or config customers)",
                              "input");
    }

    std::filesystem::path supply_path = config.supply_csv;
    std::filesystem::path demand_path = config.demand_csv;
    if (!config.snapshot_dir.empty()) {
        supply_path = io::find_latest_snapshot(config.snapshot_dir, io::SUPPLY_SNAPSHOT_PREFIX);
        demand_path = io::find_latest_snapshot(config.snapshot_dir, io::DEMAND_SNAPSHOT_PREFIX);
    }
    if (config.verbose) {
        std::cerr << "Loading supply from: " << supply_path.string() << std::endl;
        std::cerr << "Loading demand from: " << demand_path.string() << std::endl;
    }
    return io::load_snapshot(supply_path, demand_path, *master);
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        // 1. Engine configuration, CLI flags override the file
        io::EngineConfig engine_config;
        if (!config.config_file.empty()) {
            if (config.verbose) {
                std::cerr << "Loading configuration from: " << config.config_file << std::endl;
            }
            engine_config = io::load_engine_config(config.config_file);
        }
        algo::EngineOptions engine_options;
        engine_options.lookahead = engine_config.lookahead && !config.no_lookahead;
        engine_options.carry_reservation = engine_config.carry_reservation || config.carry_reservation;

        // 2. Load and validate input
        auto master = resolve_master(config, engine_config);
        auto scenario = load_input(config, master);

        if (config.verbose) {
            std::cerr << "Loaded " << scenario.supply.size() << " supply records and "
                      << scenario.orders.size() << " orders" << std::endl;
        }

        // 3. Setup report sink
        std::ofstream outfile;
        std::ostream* out = &std::cout;
        if (config.output_file != "-" && config.format != "null") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return EXIT_INPUT_ERROR;
            }
            out = &outfile;
        }

        std::ofstream summary_file;
        if (!config.summary_file.empty()) {
            summary_file.open(config.summary_file);
            if (!summary_file) {
                std::cerr << "Error: cannot open summary file: " << config.summary_file << std::endl;
                return EXIT_INPUT_ERROR;
            }
        }

        std::unique_ptr<core::ReportSink> sink;
        if (config.format == "null") {
            sink = std::make_unique<io::NullReportSink>();
        } else if (config.format == "csv") {
            sink = std::make_unique<io::CsvReportSink>(
                *out, config.summary_file.empty() ? nullptr : &summary_file);
        } else if (config.format == "text") {
            sink = std::make_unique<io::TextualReportSink>(*out);
        } else {
            sink = std::make_unique<io::JsonReportSink>(*out);
        }

        // 4. Run
        algo::AllocationEngine engine(engine_options);
        engine.set_report_sink(sink.get());

        if (config.verbose) {
            std::cerr << "Starting allocation (lookahead "
                      << (engine_options.lookahead ? "on" : "off") << ", carry reservation "
                      << (engine_options.carry_reservation ? "on" : "off") << ")..." << std::endl;
        }

        auto run = engine.run(scenario.supply, scenario.orders);

        if (auto* json = dynamic_cast<io::JsonReportSink*>(sink.get())) {
            json->finalize();
        }

        if (config.verbose) {
            std::cerr << "Allocation complete: " << run.summaries.size() << " periods, "
                      << run.backlog.size() << " orders still open" << std::endl;
        }

        if (config.metrics) {
            io::write_metrics(io::compute_metrics(run.summaries, run.results), std::cerr);
        }

        // 5. Audit
        if (config.audit) {
            auto violations = algo::audit_run(run);
            for (const auto& violation : violations) {
                std::cerr << "Audit: " << algo::to_string(violation.rule) << " at "
                          << io::format_period(violation.period);
                if (!violation.order_id.empty()) {
                    std::cerr << " [" << violation.order_id << "]";
                }
                std::cerr << ": " << violation.message << std::endl;
            }
            if (!violations.empty()) {
                return EXIT_AUDIT_FAILURE;
            }
            if (config.verbose) {
                std::cerr << "Audit passed" << std::endl;
            }
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Input error: " << e.what() << std::endl;
        return EXIT_INPUT_ERROR;
    }
    catch (const core::ValidationError& e) {
        std::cerr << "Input error: " << e.what() << std::endl;
        return EXIT_INPUT_ERROR;
    }
    catch (const core::AllocationError& e) {
        std::cerr << "Computation error: " << e.what() << std::endl;
        return EXIT_COMPUTATION_ERROR;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return EXIT_USAGE;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_INPUT_ERROR;
    }
}
