// SPDX-License-Identifier: Apache-2.0
#include "game/plane.hpp"

#include <cmath>

namespace s2d::game {

float wrap(float v, float dim)
{
    float r = std::fmod(v, dim);
    if (r < 0.f)
        r += dim;
    // fmod of a tiny negative value plus dim rounds back up to dim in float
    if (r >= dim)
        r = 0.f;
    return r;
}

Vec2 wrap(const Plane &plane, Vec2 p)
{
    return {wrap(p.x, plane.width), wrap(p.y, plane.height)};
}

Vec2 wrap_delta(const Plane &plane, Vec2 delta)
{
    if (std::fabs(delta.x) > plane.width * 0.5f)
        delta.x = delta.x > 0.f ? delta.x - plane.width : delta.x + plane.width;
    if (std::fabs(delta.y) > plane.height * 0.5f)
        delta.y = delta.y > 0.f ? delta.y - plane.height : delta.y + plane.height;
    return delta;
}

Vec2 heading(float angle)
{
    return {std::cos(angle), std::sin(angle)};
}

} // namespace s2d::game
