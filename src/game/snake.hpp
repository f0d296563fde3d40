// SPDX-License-Identifier: Apache-2.0
// snake.hpp - snake actor state, steering and per-tick head advance
#pragma once
#include "game/plane.hpp"
#include "game/segment_chain.hpp"

#include <cstdint>
#include <string>

namespace s2d::game {

// Keys held by one player during a tick; sampled once per tick by the host.
struct InputState
{
    bool turn_left{false};
    bool turn_right{false};
    bool fire{false};
};

struct Snake
{
    uint32_t id{0}; // 1-based player slot
    Vec2 head{0.f, 0.f};
    float angle{0.f}; // always equal to target_angle, in (-pi, pi]
    float target_angle{0.f};
    SegmentChain body;
    uint32_t target_length{0};
    uint32_t score{0};
    bool alive{true};
    uint64_t slow_until_tick{0}; // slowed while now < slow_until_tick
    uint64_t shoot_cooldown_until_tick{0}; // firing ignored while now < this
};

// Player label used in match-end reasons, e.g. "Player 1 (Green)".
std::string player_label(uint32_t snake_id);

// Normalises into (-pi, pi] by whole turns.
float normalize_angle(float a);

Snake spawn_snake(uint32_t id, const Plane &plane, Vec2 head, float angle, float spacing, uint32_t length);

// Rate-limited turning: each held key moves target_angle by rotation_speed; angle snaps to it.
void steer(Snake &snake, const InputState &input, float rotation_speed);

bool is_slowed(const Snake &snake, uint64_t now);
float effective_speed(const Snake &snake, float shared_speed, float slow_factor, uint64_t now);

// Head moves along angle by speed, wraps, then the body follows.
void advance(Snake &snake, const Plane &plane, float speed);

} // namespace s2d::game
