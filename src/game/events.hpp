// SPDX-License-Identifier: Apache-2.0
// events.hpp - discrete per-tick outputs consumed by the host (rendering, score panels, replay)
#pragma once
#include "game/match_state.hpp"

#include <cstdint>
#include <variant>
#include <vector>

namespace s2d::game {

struct ProjectileFired
{
    uint32_t projectile_id;
    uint32_t owner;
    Vec2 origin;
    Vec2 velocity;
};

struct ProjectileExpired
{
    uint32_t projectile_id;
    uint32_t owner;
};

struct ProjectileHit
{
    uint32_t projectile_id;
    uint32_t owner;
    uint32_t victim;
    uint64_t slow_until_tick;
};

struct ScoreChanged
{
    uint32_t snake_id;
    uint32_t delta;
    uint32_t total;
};

struct LengthChanged
{
    uint32_t snake_id;
    uint32_t delta;
    uint32_t target_length;
};

struct SpeedChanged
{
    float previous;
    float current;
    bool capped; // current reached the difficulty maximum
};

struct FoodRelocated
{
    Vec2 position;
    uint32_t eaten_by; // 0 for the initial placement
    uint32_t attempts;
    bool fallback;
};

struct SnakeDied
{
    uint32_t snake_id;
    DeathCause cause;
};

struct MatchEnded
{
    MatchOutcome outcome;
};

using Event = std::variant<
    ProjectileFired,
    ProjectileExpired,
    ProjectileHit,
    ScoreChanged,
    LengthChanged,
    SpeedChanged,
    FoodRelocated,
    SnakeDied,
    MatchEnded>;

struct TickOutput
{
    uint64_t tick{0};
    MatchStatus status{MatchStatus::running};
    std::vector<Event> events;

    template <typename T>
    const T *find() const
    {
        for (auto &e : events)
            if (auto *p = std::get_if<T>(&e))
                return p;
        return nullptr;
    }

    template <typename T>
    size_t count() const
    {
        size_t n = 0;
        for (auto &e : events)
            if (std::holds_alternative<T>(e))
                ++n;
        return n;
    }
};

} // namespace s2d::game
