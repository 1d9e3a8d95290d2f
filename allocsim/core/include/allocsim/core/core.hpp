#pragma once

/// @defgroup core Core Library
/// @brief Order, supply and backlog records, tiers, errors, and the report interface.
///
/// The core library provides the typed records the allocation engine works
/// on: supply per period, customer orders with their fulfilment state
/// machine, the closed priority-tier enumeration, the per-period backlog,
/// and the output rows handed to a ReportSink. It has no dependencies on
/// the allocation algorithms or on I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Period and quantity types, checked arithmetic, priority tiers.

// Convenience header for Library 1
#include <allocsim/core/types.hpp>
#include <allocsim/core/error.hpp>
#include <allocsim/core/priority_tier.hpp>
#include <allocsim/core/order_status.hpp>
#include <allocsim/core/supply_record.hpp>
#include <allocsim/core/demand_order.hpp>
#include <allocsim/core/backlog.hpp>
#include <allocsim/core/period_summary.hpp>
#include <allocsim/core/allocation_result.hpp>
#include <allocsim/core/report_sink.hpp>
