#pragma once

/// @defgroup io I/O Library
/// @brief JSON and CSV loading, report output, scenario generation, and metrics.
///
/// The I/O library handles all external data formats: loading JSON
/// scenarios, CSV snapshot exports, customer masters and engine
/// configuration files, writing allocation reports (JSON, CSV, textual,
/// in-memory), computing post-run metrics (fill rates, constraint counts,
/// fulfilment latency), and generating mock supply and demand.
/// Depends on core only.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Scenario, snapshot, customer master, and configuration loaders.

/// @defgroup io_writers Report Sinks
/// @ingroup io
/// @brief JSON, CSV, textual, memory, and null report sinks.

/// @defgroup io_metrics Metrics
/// @ingroup io
/// @brief Post-run fill rates and latency statistics.

/// @defgroup io_generation Generation
/// @ingroup io
/// @brief Mock supply and demand generation.

// Convenience header for Library 3 (I/O)

#include <allocsim/io/error.hpp>
#include <allocsim/io/period_label.hpp>
#include <allocsim/io/csv.hpp>
#include <allocsim/io/customer_master.hpp>
#include <allocsim/io/scenario_loader.hpp>
#include <allocsim/io/csv_snapshot.hpp>
#include <allocsim/io/engine_config.hpp>
#include <allocsim/io/report_sinks.hpp>
#include <allocsim/io/scenario_generation.hpp>
#include <allocsim/io/metrics.hpp>
