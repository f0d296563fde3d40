// SPDX-License-Identifier: Apache-2.0
#include "game/snake.hpp"

#include <cmath>

namespace s2d::game {

std::string player_label(uint32_t snake_id)
{
    switch (snake_id) {
        case 1:
            return "Player 1 (Green)";
        case 2:
            return "Player 2 (Blue)";
        default:
            return "Player " + std::to_string(snake_id);
    }
}

float normalize_angle(float a)
{
    const float pi = (float)M_PI;
    const float two_pi = 2.f * pi;
    if (!std::isfinite(a))
        return 0.f;
    // Whole-turn folding keeps the steering loop O(1) even for large accumulated inputs.
    if (std::fabs(a) > 4.f * two_pi)
        a = std::fmod(a, two_pi);
    while (a > pi)
        a -= two_pi;
    while (a <= -pi)
        a += two_pi;
    return a;
}

Snake spawn_snake(uint32_t id, const Plane &plane, Vec2 head, float angle, float spacing, uint32_t length)
{
    Snake s;
    s.id = id;
    s.head = wrap(plane, head);
    s.angle = normalize_angle(angle);
    s.target_angle = s.angle;
    s.body = SegmentChain(spacing);
    s.body.reset_straight(plane, s.head, s.angle, length);
    s.target_length = length;
    return s;
}

void steer(Snake &snake, const InputState &input, float rotation_speed)
{
    if (input.turn_left)
        snake.target_angle -= rotation_speed;
    if (input.turn_right)
        snake.target_angle += rotation_speed;
    snake.target_angle = normalize_angle(snake.target_angle);
    snake.angle = snake.target_angle;
}

bool is_slowed(const Snake &snake, uint64_t now)
{
    return now < snake.slow_until_tick;
}

float effective_speed(const Snake &snake, float shared_speed, float slow_factor, uint64_t now)
{
    return is_slowed(snake, now) ? shared_speed * slow_factor : shared_speed;
}

void advance(Snake &snake, const Plane &plane, float speed)
{
    snake.head = wrap(plane, b2MulAdd(snake.head, speed, heading(snake.angle)));
    snake.body.follow(plane, snake.head, snake.target_length);
}

} // namespace s2d::game
