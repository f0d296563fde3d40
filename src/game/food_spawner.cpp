// SPDX-License-Identifier: Apache-2.0
#include "game/food_spawner.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace s2d::game {

FoodSpawner::FoodSpawner(const MatchConfig &cfg, uint32_t seed)
    : min_x_(cfg.food_margin)
    , min_y_(cfg.food_margin)
    , max_x_(cfg.world_width - cfg.food_margin)
    , max_y_(cfg.world_height - cfg.food_margin)
    , head_exclusion_(cfg.food_head_exclusion)
    , body_exclusion_(cfg.food_body_exclusion)
    , max_attempts_(std::max<uint32_t>(1, cfg.food_max_attempts))
    , rng_(seed)
{}

float FoodSpawner::clearance(const MatchState &state, Vec2 p) const
{
    float best = std::numeric_limits<float>::infinity();
    for (auto &s : state.snakes) {
        if (!s.alive)
            continue;
        best = std::min(best, distance(p, s.head) - head_exclusion_);
        for (auto &seg : s.body.segments())
            best = std::min(best, distance(p, seg) - body_exclusion_);
    }
    return best;
}

FoodPlacement FoodSpawner::place(const MatchState &state)
{
    std::uniform_real_distribution<float> ux(min_x_, max_x_);
    std::uniform_real_distribution<float> uy(min_y_, max_y_);
    for (uint32_t attempt = 1; attempt <= max_attempts_; ++attempt) {
        Vec2 p{ux(rng_), uy(rng_)};
        if (clearance(state, p) >= 0.f) {
            metrics::add_food_placement(attempt, false);
            return {p, attempt, false};
        }
    }
    auto fb = fallback(state, max_attempts_);
    metrics::add_food_placement(fb.attempts, true);
    log::warn(
        "[food] rejection sampling exhausted after {} draws; grid fallback at ({}, {}) clearance={}",
        max_attempts_,
        fb.position.x,
        fb.position.y,
        clearance(state, fb.position));
    return fb;
}

FoodPlacement FoodSpawner::fallback(const MatchState &state, uint32_t attempts) const
{
    const float cell = std::max(1.f, body_exclusion_);
    const float span_x = max_x_ - min_x_;
    const float span_y = max_y_ - min_y_;
    const int cols = std::max(1, static_cast<int>(std::ceil(span_x / cell)));
    const int rows = std::max(1, static_cast<int>(std::ceil(span_y / cell)));
    const float step_x = span_x / static_cast<float>(cols);
    const float step_y = span_y / static_cast<float>(rows);
    FoodPlacement best{{min_x_ + step_x * 0.5f, min_y_ + step_y * 0.5f}, attempts, true};
    float best_clearance = -std::numeric_limits<float>::infinity();
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            Vec2 centre{
                min_x_ + step_x * (static_cast<float>(c) + 0.5f), min_y_ + step_y * (static_cast<float>(r) + 0.5f)};
            float cl = clearance(state, centre);
            if (cl > best_clearance) {
                best_clearance = cl;
                best.position = centre;
            }
        }
    }
    return best;
}

} // namespace s2d::game
