// SPDX-License-Identifier: Apache-2.0
// match.hpp - fixed-step match loop: owns the match state and sequences every component once per tick
#pragma once
#include "game/collision.hpp"
#include "game/config.hpp"
#include "game/events.hpp"
#include "game/food_spawner.hpp"
#include "game/match_state.hpp"
#include "game/snake.hpp"

#include <array>
#include <string>

namespace s2d::game {

// Index 0 drives snake 1, index 1 drives snake 2 (ignored in single mode).
using PlayerInputs = std::array<InputState, 2>;

class Match
{
public:
    // Validates cfg (std::invalid_argument), spawns the snakes and places the first food.
    explicit Match(const MatchConfig &cfg);
    ~Match();

    Match(const Match &) = delete;
    Match &operator=(const Match &) = delete;

    // One simulation step. After the match has ended this returns immediately with no events.
    TickOutput tick(const PlayerInputs &inputs);

    // Host-side termination (e.g. the playfield changed size). No winner. Returns false if already ended.
    bool end(std::string reason);

    const MatchState &state() const { return state_; }
    bool over() const { return state_.status == MatchStatus::ended; }
    // Placement made by the constructor, reported as a FoodRelocated with eaten_by == 0 by hosts that record it.
    const FoodPlacement &initial_food() const { return initial_food_; }
    // Direct state access for scenario setup between ticks.
    MatchState &mutable_state() { return state_; }

private:
    void on_ended();

    MatchState state_;
    FoodSpawner spawner_;
    CollisionResolver resolver_;
    FoodPlacement initial_food_;
};

} // namespace s2d::game
