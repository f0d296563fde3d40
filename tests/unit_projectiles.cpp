// SPDX-License-Identifier: Apache-2.0
// unit_projectiles.cpp
// Projectile lifetime, cooldown gating, owner immunity and slow overwrite.
#include "game/match.hpp"
#include "game/projectiles.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <vector>

using namespace s2d::game;
namespace t = s2d::test;

static void lifetime_expiry()
{
    Match m(t::duo_config());
    auto &st = m.mutable_state();
    assert(st.durations.projectile_lifetime == 90);
    // Keep the opponent off the firing line.
    t::place_snake(st, 2, Vec2{450.f, 100.f}, (float)M_PI);
    t::park_food(st, Vec2{300.f, 500.f});

    auto out = m.tick(t::hold(1, false, false, true));
    const uint64_t fired_at = out.tick;
    assert(fired_at == 1);
    auto *fired = out.find<ProjectileFired>();
    assert(fired && fired->owner == 1);
    // Spawned at the post-move head, then advanced once in the same tick.
    assert(t::near(fired->origin.x, st.snakes[0].head.x) && t::near(fired->origin.y, 300.f));
    assert(st.projectiles.size() == 1);
    assert(t::near(st.projectiles[0].position.x, fired->origin.x + 8.f));
    const uint32_t projectile_id = fired->projectile_id;

    while (st.tick < fired_at + 90) {
        t::park_food(st, Vec2{300.f, 500.f});
        out = m.tick(t::no_input());
        assert(out.count<ProjectileExpired>() == 0);
    }
    assert(st.projectiles.size() == 1);
    out = m.tick(t::no_input());
    assert(out.tick == fired_at + 91);
    assert(st.projectiles.empty());
    auto *exp = out.find<ProjectileExpired>();
    assert(exp && exp->projectile_id == projectile_id);
    assert(m.state().status == MatchStatus::running);
}

static void cooldown()
{
    Match m(t::duo_config());
    auto &st = m.mutable_state();
    t::place_snake(st, 2, Vec2{450.f, 100.f}, (float)M_PI);
    std::vector<uint64_t> fired_ticks;
    for (int i = 0; i < 125; ++i) {
        t::park_food(st, Vec2{300.f, 500.f});
        auto out = m.tick(t::hold(1, false, false, true));
        if (out.find<ProjectileFired>())
            fired_ticks.push_back(out.tick);
    }
    // Cooldown of 60 ticks: fires on 1, 61, 121.
    assert(fired_ticks.size() == 3);
    assert(fired_ticks[0] == 1 && fired_ticks[1] == 61 && fired_ticks[2] == 121);
    assert(st.snakes[0].shoot_cooldown_until_tick == 181);
}

static void owner_immunity_and_slow_overwrite()
{
    Match m(t::duo_config());
    auto &st = m.mutable_state();
    st.tick = 10;
    TickOutput out;
    Snake &a = st.snakes[0];
    Snake &b = st.snakes[1];

    // A projectile sitting on its owner's head does nothing.
    assert(try_fire(st, a, out));
    assert(st.projectiles.size() == 1);
    resolve_projectile_hits(st, out);
    assert(st.projectiles.size() == 1);
    assert(a.slow_until_tick == 0);
    assert(out.count<ProjectileHit>() == 0);

    // Cooldown blocks a second shot on the same tick.
    assert(!try_fire(st, a, out));

    // Moved onto the opponent's head: hit, slowed until now + 60, projectile consumed.
    st.projectiles[0].position = b.head;
    resolve_projectile_hits(st, out);
    assert(st.projectiles.empty());
    assert(b.slow_until_tick == 70);
    auto *hit = out.find<ProjectileHit>();
    assert(hit && hit->victim == 2 && hit->owner == 1 && hit->slow_until_tick == 70);
    assert(is_slowed(b, 69) && !is_slowed(b, 70));

    // A later hit overwrites the expiry instead of stacking it.
    st.tick = 20;
    assert(try_fire(st, b, out));
    st.projectiles[0].position = a.head;
    resolve_projectile_hits(st, out);
    assert(a.slow_until_tick == 80);
    st.tick = 30;
    st.projectiles.push_back(Projectile{99, b.head, Vec2{0.f, 0.f}, 1, 30});
    resolve_projectile_hits(st, out);
    assert(b.slow_until_tick == 90);

    // Dead snakes cannot fire and are never hit.
    b.alive = false;
    b.shoot_cooldown_until_tick = 0;
    assert(!try_fire(st, b, out));
    st.projectiles.push_back(Projectile{100, b.head, Vec2{0.f, 0.f}, 1, 30});
    resolve_projectile_hits(st, out);
    assert(st.projectiles.size() == 1);
}

static void single_mode_ignores_fire()
{
    Match m(MatchConfig{});
    auto out = m.tick(t::hold(1, false, false, true));
    assert(out.count<ProjectileFired>() == 0);
    assert(m.state().projectiles.empty());
}

int main()
{
    lifetime_expiry();
    cooldown();
    owner_immunity_and_slow_overwrite();
    single_mode_ignores_fire();
    std::cout << "unit_projectiles OK" << std::endl;
    return 0;
}
