// SPDX-License-Identifier: Apache-2.0
// segment_chain.hpp - follow-the-leader body of one snake
#pragma once
#include "game/plane.hpp"

#include <cstddef>
#include <vector>

namespace s2d::game {

// Ordered body positions, index 0 nearest the head. Each tick every segment is pulled toward its predecessor
// (the head for index 0) so that it ends exactly `spacing` away whenever the gap has opened beyond `spacing`;
// otherwise it stays where it is. Growth appends clones of the tail which separate over the following ticks.
class SegmentChain
{
public:
    explicit SegmentChain(float spacing = 8.f)
        : spacing_(spacing)
    {}

    // Straight body behind `head` along `angle`, segment i at head - (i + 1) * spacing.
    void reset_straight(const Plane &plane, Vec2 head, float angle, size_t count);

    // Materialise up to target_length (tail clones) and run one follow pass against `head`.
    void follow(const Plane &plane, Vec2 head, size_t target_length);

    // Appends clones of the current tail (or of `head` for an empty chain) until size() == target_length.
    void grow_to(Vec2 head, size_t target_length);

    const std::vector<Vec2> &segments() const { return segments_; }
    size_t size() const { return segments_.size(); }
    bool empty() const { return segments_.empty(); }
    float spacing() const { return spacing_; }

private:
    std::vector<Vec2> segments_;
    float spacing_;
};

} // namespace s2d::game
