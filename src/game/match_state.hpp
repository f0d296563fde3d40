// SPDX-License-Identifier: Apache-2.0
// match_state.hpp - complete mutable state of one match, passed explicitly to every step function
#pragma once
#include "game/config.hpp"
#include "game/plane.hpp"
#include "game/snake.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace s2d::game {

enum class MatchStatus
{
    running,
    ended
};

enum class Winner
{
    none,
    snake,
    tie
};

enum class DeathCause
{
    none,
    self_hit,
    head_on,
    hit_opponent
};

struct MatchOutcome
{
    Winner winner{Winner::none};
    uint32_t winner_id{0}; // valid when winner == Winner::snake
    std::string reason;
};

struct Food
{
    Vec2 position{0.f, 0.f};
};

struct Projectile
{
    uint32_t id{0};
    Vec2 position{0.f, 0.f};
    Vec2 velocity{0.f, 0.f};
    uint32_t owner{0};
    uint64_t spawn_tick{0};
};

// Durations of MatchConfig converted to ticks once at match start.
struct TickDurations
{
    uint64_t projectile_lifetime{0};
    uint64_t shoot_cooldown{0};
    uint64_t slow{0};
};

struct MatchState
{
    MatchConfig config;
    Plane plane;
    TickDurations durations;
    uint64_t tick{0};
    float speed{0.f}; // shared by every snake
    std::vector<Snake> snakes; // index = id - 1
    Food food;
    std::vector<Projectile> projectiles;
    uint32_t next_projectile_id{1};
    MatchStatus status{MatchStatus::running};
    MatchOutcome outcome;

    Snake *find_snake(uint32_t id)
    {
        return id >= 1 && id <= snakes.size() ? &snakes[id - 1] : nullptr;
    }
    const Snake *find_snake(uint32_t id) const
    {
        return id >= 1 && id <= snakes.size() ? &snakes[id - 1] : nullptr;
    }
};

const char *to_string(MatchStatus s);
const char *to_string(Winner w);
const char *to_string(DeathCause c);

} // namespace s2d::game
