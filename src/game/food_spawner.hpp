// SPDX-License-Identifier: Apache-2.0
// food_spawner.hpp - rejection-sampled food placement with a bounded, deterministic fallback
#pragma once
#include "game/match_state.hpp"

#include <cstdint>
#include <random>

namespace s2d::game {

struct FoodPlacement
{
    Vec2 position{0.f, 0.f};
    uint32_t attempts{0}; // random draws consumed
    bool fallback{false}; // grid scan used after every draw was rejected
};

class FoodSpawner
{
public:
    FoodSpawner(const MatchConfig &cfg, uint32_t seed);

    // Uniform draw inside the inset rectangle, accepted when it clears every live snake's head by the head
    // exclusion radius and every segment by the body exclusion radius. After max_attempts rejections the
    // best-cleared grid cell centre is returned instead.
    FoodPlacement place(const MatchState &state);

    // Signed clearance of p: positive when both exclusion radii are satisfied for every live snake.
    float clearance(const MatchState &state, Vec2 p) const;

private:
    FoodPlacement fallback(const MatchState &state, uint32_t attempts) const;

    float min_x_;
    float min_y_;
    float max_x_;
    float max_y_;
    float head_exclusion_;
    float body_exclusion_;
    uint32_t max_attempts_;
    std::mt19937 rng_;
};

} // namespace s2d::game
