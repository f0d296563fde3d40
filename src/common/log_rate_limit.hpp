// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <cstdint>

// Tick-keyed rate limiting for diagnostics emitted from inside the simulation step.
// S2D_LOG_EVERY_N_TICKS(debug, tick, 60, "fmt {}", v) logs only on ticks that are a multiple of N, so the
// output of a replayed match is identical line for line. The level check runs first so filtered calls cost
// one comparison and no formatting.
#define S2D_LOG_EVERY_N_TICKS(lvl, tick, N, ...) \
    do { \
        if (s2d::log::enabled(s2d::log::level::lvl) && (N) > 0 && (static_cast<uint64_t>(tick) % (N)) == 0) { \
            s2d::log::lvl(__VA_ARGS__); \
        } \
    } while (0)
