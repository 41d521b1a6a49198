#pragma once

// Effect construction layer and its single-node runner
//   - effect/constructors.hpp: values, standard conversions, sync side effects
//   - effect/async.hpp: callback and sender bridges
//   - effect/blocking.hpp: blocking-pool dispatch
//   - effect/refine.hpp: error narrowing
//   - runtime.hpp: pools, fibers, run_sync

#include "config.hpp"                // Runtime configuration
#include "effect/async.hpp"          // effect_async, from_future
#include "effect/blocking.hpp"       // effect_blocking, blocking
#include "effect/constructors.hpp"   // succeed, fail, from_*, effect
#include "effect/exit.hpp"           // Outcomes and defects
#include "effect/fiber.hpp"          // Fiber handles
#include "effect/refine.hpp"         // refine_or_die
#include "effect/run.hpp"            // evaluate
#include "log.hpp"                   // Log level control
#include "runtime.hpp"               // Runtime and pools
