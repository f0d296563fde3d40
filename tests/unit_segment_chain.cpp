// SPDX-License-Identifier: Apache-2.0
// unit_segment_chain.cpp
// Body following: spacing after settling, tail-clone growth, truncation and following across the seam.
#include "game/segment_chain.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>

using namespace s2d::game;
using s2d::test::near;

static float wrapped_gap(const Plane &plane, Vec2 a, Vec2 b)
{
    return b2Length(wrap_delta(plane, b2Sub(a, b)));
}

int main()
{
    Plane plane{600.f, 600.f};
    SegmentChain chain(8.f);
    Vec2 head{300.f, 300.f};
    chain.reset_straight(plane, head, 0.f, 15);
    assert(chain.size() == 15);
    for (size_t i = 0; i < chain.size(); ++i) {
        assert(near(chain.segments()[i].x, 300.f - 8.f * static_cast<float>(i + 1)));
        assert(near(chain.segments()[i].y, 300.f));
    }

    // Straight motion keeps every gap at exactly the spacing.
    for (int t = 0; t < 50; ++t) {
        head.x += 2.5f;
        chain.follow(plane, head, 15);
        assert(near(wrapped_gap(plane, head, chain.segments()[0]), 8.f));
        for (size_t i = 1; i < chain.size(); ++i)
            assert(near(wrapped_gap(plane, chain.segments()[i - 1], chain.segments()[i]), 8.f));
    }

    // Turning: no gap ever exceeds the spacing once a follow pass ran.
    float angle = 0.f;
    for (int t = 0; t < 200; ++t) {
        angle += 0.07f;
        head = wrap(plane, b2MulAdd(head, 2.5f, heading(angle)));
        chain.follow(plane, head, 15);
        assert(wrapped_gap(plane, head, chain.segments()[0]) <= 8.f + 1e-3f);
        for (size_t i = 1; i < chain.size(); ++i)
            assert(wrapped_gap(plane, chain.segments()[i - 1], chain.segments()[i]) <= 8.f + 1e-3f);
    }

    // Growth appends clones of the tail; they separate only as the chain moves on.
    SegmentChain grow(8.f);
    Vec2 gh{100.f, 100.f};
    grow.reset_straight(plane, gh, 0.f, 15);
    Vec2 old_tail = grow.segments().back();
    gh.x += 2.5f;
    grow.follow(plane, gh, 20);
    assert(grow.size() == 20);
    for (size_t i = 15; i < 20; ++i)
        assert(near(grow.segments()[i].x, old_tail.x) && near(grow.segments()[i].y, old_tail.y));
    for (int t = 0; t < 40; ++t) {
        gh.x += 2.5f;
        grow.follow(plane, gh, 20);
    }
    for (size_t i = 1; i < grow.size(); ++i)
        assert(near(wrapped_gap(plane, grow.segments()[i - 1], grow.segments()[i]), 8.f));

    // Empty chains grow from the head position.
    SegmentChain empty(8.f);
    empty.grow_to(Vec2{5.f, 6.f}, 3);
    assert(empty.size() == 3 && near(empty.segments()[2].x, 5.f) && near(empty.segments()[2].y, 6.f));

    // A smaller target truncates from the tail.
    grow.follow(plane, gh, 10);
    assert(grow.size() == 10);

    // Crossing the right edge: the first segment follows the wrapped short way.
    SegmentChain seam(8.f);
    Vec2 sh{2.f, 300.f};
    seam.reset_straight(plane, sh, 0.f, 15);
    assert(near(seam.segments()[0].x, 594.f));
    sh.x += 2.5f;
    seam.follow(plane, sh, 15);
    assert(near(seam.segments()[0].x, 596.5f));
    assert(near(wrapped_gap(plane, sh, seam.segments()[0]), 8.f));
    for (auto &s : seam.segments())
        assert(s.x >= 0.f && s.x < 600.f);

    std::cout << "unit_segment_chain OK" << std::endl;
    return 0;
}
