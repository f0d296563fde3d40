// SPDX-License-Identifier: Apache-2.0
// plane.hpp - toroidal coordinate arithmetic shared by every simulation component
#pragma once
#include <box2d/math_functions.h>

namespace s2d::game {

using Vec2 = b2Vec2;

struct Plane
{
    float width{600.f};
    float height{600.f};
};

// Folds v into [0, dim). Values exactly at dim (or any multiple) map to 0.
float wrap(float v, float dim);
Vec2 wrap(const Plane &plane, Vec2 p);

// Shortest per-axis displacement on the torus: an axis component larger than half the dimension is replaced by
// its complement through the opposite edge.
Vec2 wrap_delta(const Plane &plane, Vec2 delta);

// Plain Euclidean distance, no seam correction. Hit tests use this deliberately, so a head and a segment that
// touch across an edge do not collide.
inline float distance(Vec2 a, Vec2 b)
{
    return b2Distance(a, b);
}

// Unit heading vector for an angle in radians (0 = +x, pi/2 = +y).
Vec2 heading(float angle);

} // namespace s2d::game
