#pragma once

/// @defgroup algo Algo Library
/// @brief Constraint resolution, waterfall and FIFO allocation, rollover, and the engine.
///
/// The algo library implements the allocation pass on top of the core
/// records: the constraint resolver deriving each period's Global Build
/// Limit, the tier waterfall, the oldest-first distributor, the period
/// rollover, the engine chaining them across periods, and an auditor that
/// re-checks a finished run. Depends on core only.

/// @defgroup algo_resolver Constraint Resolver
/// @ingroup algo
/// @brief Global Build Limit and lookahead reservation.

/// @defgroup algo_allocators Allocators
/// @ingroup algo
/// @brief Tier waterfall and FIFO backlog distribution.

/// @defgroup algo_engine Engine
/// @ingroup algo
/// @brief Period orchestration and rollover.

/// @defgroup algo_audit Audit
/// @ingroup algo
/// @brief Invariant checks over finished runs.

// Convenience header for Library 2 (liballocsim-algo)

#include <allocsim/algo/constraint_resolver.hpp>
#include <allocsim/algo/waterfall_allocator.hpp>
#include <allocsim/algo/fifo_distributor.hpp>
#include <allocsim/algo/period_rollover.hpp>
#include <allocsim/algo/allocation_engine.hpp>
#include <allocsim/algo/run_auditor.hpp>
