// SPDX-License-Identifier: Apache-2.0
#include "game/projectiles.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>
#include <iterator>

namespace s2d::game {

bool try_fire(MatchState &state, Snake &shooter, TickOutput &out)
{
    if (!shooter.alive || state.tick < shooter.shoot_cooldown_until_tick)
        return false;
    Projectile p;
    p.id = state.next_projectile_id++;
    p.position = shooter.head;
    p.velocity = b2MulSV(state.config.projectile_speed, heading(shooter.angle));
    p.owner = shooter.id;
    p.spawn_tick = state.tick;
    state.projectiles.push_back(p);
    shooter.shoot_cooldown_until_tick = state.tick + state.durations.shoot_cooldown;
    out.events.emplace_back(ProjectileFired{p.id, p.owner, p.position, p.velocity});
    metrics::runtime().projectiles_fired.fetch_add(1, std::memory_order_relaxed);
    log::debug(
        "[proj] fire id={} owner={} pos=({}, {}) angle={} cooldown_until={}",
        p.id,
        p.owner,
        p.position.x,
        p.position.y,
        shooter.angle,
        shooter.shoot_cooldown_until_tick);
    return true;
}

void advance_projectiles(MatchState &state, TickOutput &out)
{
    const uint64_t now = state.tick;
    const uint64_t lifetime = state.durations.projectile_lifetime;
    auto &projs = state.projectiles;
    auto expired = std::remove_if(
        projs.begin(),
        projs.end(),
        [&](const Projectile &p)
        {
            if (now - p.spawn_tick <= lifetime)
                return false;
            out.events.emplace_back(ProjectileExpired{p.id, p.owner});
            return true;
        });
    auto removed = static_cast<uint64_t>(std::distance(expired, projs.end()));
    projs.erase(expired, projs.end());
    if (removed > 0)
        metrics::runtime().projectiles_expired.fetch_add(removed, std::memory_order_relaxed);
    for (auto &p : projs)
        p.position = wrap(state.plane, b2Add(p.position, p.velocity));
}

void resolve_projectile_hits(MatchState &state, TickOutput &out)
{
    const uint64_t now = state.tick;
    const float radius = state.config.projectile_hit_radius;
    auto &projs = state.projectiles;
    auto consumed = std::remove_if(
        projs.begin(),
        projs.end(),
        [&](const Projectile &p)
        {
            for (auto &s : state.snakes) {
                if (!s.alive || s.id == p.owner)
                    continue;
                if (distance(p.position, s.head) < radius) {
                    s.slow_until_tick = now + state.durations.slow;
                    out.events.emplace_back(ProjectileHit{p.id, p.owner, s.id, s.slow_until_tick});
                    metrics::runtime().projectile_hits.fetch_add(1, std::memory_order_relaxed);
                    log::debug(
                        "[proj] hit id={} owner={} victim={} slow_until={}", p.id, p.owner, s.id, s.slow_until_tick);
                    return true;
                }
            }
            return false;
        });
    projs.erase(consumed, projs.end());
    metrics::runtime().projectiles_active.store(projs.size(), std::memory_order_relaxed);
}

} // namespace s2d::game
