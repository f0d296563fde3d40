// SPDX-License-Identifier: Apache-2.0
// collision.hpp - per-tick rule engine: food pickup, self and inter-snake collisions, match termination
#pragma once
#include "game/events.hpp"
#include "game/food_spawner.hpp"
#include "game/match_state.hpp"

#include <cstdint>
#include <vector>

namespace s2d::game {

class CollisionResolver
{
public:
    explicit CollisionResolver(FoodSpawner &spawner)
        : spawner_(spawner)
    {}

    // Runs, in order: food pickup, self-collision, inter-snake collision (duo), termination.
    // Does nothing once the match has ended. Pickup rewards are kept even when the same tick ends the match.
    void resolve(MatchState &state, TickOutput &out);

private:
    struct Death
    {
        uint32_t snake_id;
        DeathCause cause;
    };

    void resolve_food(MatchState &state, TickOutput &out);
    void resolve_self(const MatchState &state, std::vector<Death> &deaths) const;
    void resolve_inter(const MatchState &state, std::vector<Death> &deaths) const;
    void finish(MatchState &state, const std::vector<Death> &deaths, TickOutput &out) const;

    FoodSpawner &spawner_;
};

// Applies the hard-difficulty speed growth; returns the (possibly unchanged) shared speed.
float speed_after_pickup(const MatchConfig &cfg, float speed);

} // namespace s2d::game
