// SPDX-License-Identifier: Apache-2.0
#include "game/segment_chain.hpp"

namespace s2d::game {

void SegmentChain::reset_straight(const Plane &plane, Vec2 head, float angle, size_t count)
{
    segments_.clear();
    segments_.reserve(count);
    Vec2 back = heading(angle);
    for (size_t i = 1; i <= count; ++i)
        segments_.push_back(wrap(plane, b2MulSub(head, spacing_ * static_cast<float>(i), back)));
}

void SegmentChain::grow_to(Vec2 head, size_t target_length)
{
    if (segments_.size() >= target_length)
        return;
    Vec2 tail = segments_.empty() ? head : segments_.back();
    segments_.resize(target_length, tail);
}

void SegmentChain::follow(const Plane &plane, Vec2 head, size_t target_length)
{
    grow_to(head, target_length);
    if (segments_.size() > target_length)
        segments_.resize(target_length);
    // Head to tail: segment i chases the already-updated position of i - 1.
    Vec2 target = head;
    for (auto &seg : segments_) {
        Vec2 delta = wrap_delta(plane, b2Sub(target, seg));
        float dist = b2Length(delta);
        if (dist > spacing_) {
            float ratio = spacing_ / dist;
            seg = wrap(plane, b2MulSub(target, ratio, delta));
        }
        target = seg;
    }
}

} // namespace s2d::game
