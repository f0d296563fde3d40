// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide simulation counters (atomics, no dynamic allocation on the update path).
#pragma once
#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace s2d::metrics {

struct RuntimeCounters
{
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    // Power-of-two buckets for tick duration (base 8us) -> up to ~16ms.
    static constexpr uint64_t TICK_BASE_NS = 8000;
    static constexpr int TICK_BUCKETS = 12;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{}; // bucket 0:<8us,1:<16us,...
    // Paced runner idle time between ticks
    std::atomic<uint64_t> wait_duration_ns_accum{0};
    std::atomic<uint64_t> wait_samples{0};
    std::atomic<uint64_t> late_ticks{0}; // ticks started after their deadline
    // Food placement
    std::atomic<uint64_t> food_placements{0};
    std::atomic<uint64_t> food_attempts_accum{0};
    std::atomic<uint64_t> food_fallbacks{0};
    std::atomic<uint64_t> food_pickups{0};
    // Projectiles
    std::atomic<uint64_t> projectiles_fired{0};
    std::atomic<uint64_t> projectile_hits{0};
    std::atomic<uint64_t> projectiles_expired{0};
    std::atomic<uint64_t> projectiles_active{0};
    // Matches
    std::atomic<uint64_t> matches_started{0};
    std::atomic<uint64_t> matches_completed{0};
    std::atomic<uint64_t> active_matches{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline void add_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.tick_samples.fetch_add(1, std::memory_order_relaxed);
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        uint64_t bound = RuntimeCounters::TICK_BASE_NS << i;
        if (ns < bound) {
            rt.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.tick_hist[RuntimeCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

// Upper bound of the histogram bucket holding the 99th percentile tick.
inline uint64_t approx_tick_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99 - 1) / 100; // ceil(total*0.99)
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return RuntimeCounters::TICK_BASE_NS << i;
    }
    return RuntimeCounters::TICK_BASE_NS << (RuntimeCounters::TICK_BUCKETS - 1);
}

inline void add_wait_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.wait_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.wait_samples.fetch_add(1, std::memory_order_relaxed);
}

inline void add_food_placement(uint64_t attempts, bool fallback)
{
    auto &rt = runtime();
    rt.food_placements.fetch_add(1, std::memory_order_relaxed);
    rt.food_attempts_accum.fetch_add(attempts, std::memory_order_relaxed);
    if (fallback)
        rt.food_fallbacks.fetch_add(1, std::memory_order_relaxed);
}

// Single JSON object line, logged by the runner at shutdown.
inline std::string runtime_json(const char *tag)
{
    auto &rt = runtime();
    uint64_t samples = rt.tick_samples.load(std::memory_order_relaxed);
    uint64_t avg_ns = samples ? rt.tick_duration_ns_accum.load(std::memory_order_relaxed) / samples : 0;
    uint64_t wait_samples = rt.wait_samples.load(std::memory_order_relaxed);
    uint64_t wait_mean_ns = wait_samples ? rt.wait_duration_ns_accum.load(std::memory_order_relaxed) / wait_samples : 0;
    uint64_t placements = rt.food_placements.load(std::memory_order_relaxed);
    double attempts_mean =
        placements ? (double)rt.food_attempts_accum.load(std::memory_order_relaxed) / (double)placements : 0.0;
    std::ostringstream j;
    j.setf(std::ios::fixed);
    j.precision(2);
    j << "{\"metric\":\"" << tag << '"';
    j << ",\"ticks\":" << samples;
    j << ",\"avg_tick_ns\":" << avg_ns;
    j << ",\"p99_tick_ns\":" << approx_tick_p99();
    j << ",\"wait_mean_ns\":" << wait_mean_ns;
    j << ",\"late_ticks\":" << rt.late_ticks.load(std::memory_order_relaxed);
    j << ",\"food_placements\":" << placements;
    j << ",\"food_attempts_mean\":" << attempts_mean;
    j << ",\"food_fallbacks\":" << rt.food_fallbacks.load(std::memory_order_relaxed);
    j << ",\"food_pickups\":" << rt.food_pickups.load(std::memory_order_relaxed);
    j << ",\"projectiles_fired\":" << rt.projectiles_fired.load(std::memory_order_relaxed);
    j << ",\"projectile_hits\":" << rt.projectile_hits.load(std::memory_order_relaxed);
    j << ",\"projectiles_expired\":" << rt.projectiles_expired.load(std::memory_order_relaxed);
    j << ",\"matches_started\":" << rt.matches_started.load(std::memory_order_relaxed);
    j << ",\"matches_completed\":" << rt.matches_completed.load(std::memory_order_relaxed);
    j << "}";
    return j.str();
}

} // namespace s2d::metrics
