// SPDX-License-Identifier: Apache-2.0
#include "game/collision.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>
#include <string>

namespace s2d::game {

namespace {

bool head_touches_body(const Snake &attacker, const Snake &other, float radius)
{
    for (auto &seg : other.body.segments()) {
        if (distance(attacker.head, seg) < radius)
            return true;
    }
    return false;
}

std::string death_reason(const MatchState &state, uint32_t snake_id, DeathCause cause)
{
    if (state.config.mode == Mode::single)
        return "You hit yourself!";
    std::string who = player_label(snake_id);
    switch (cause) {
        case DeathCause::self_hit:
            return who + " hit themselves!";
        case DeathCause::hit_opponent:
            return who + " hit " + player_label(snake_id == 1 ? 2 : 1) + "!";
        case DeathCause::head_on:
            return "Head-on collision!";
        case DeathCause::none:
            break;
    }
    return who + " crashed!";
}

} // namespace

float speed_after_pickup(const MatchConfig &cfg, float speed)
{
    if (cfg.difficulty != Difficulty::hard)
        return speed;
    return std::min(speed + cfg.hard.speed_increment, cfg.hard.max_speed);
}

void CollisionResolver::resolve(MatchState &state, TickOutput &out)
{
    if (state.status != MatchStatus::running)
        return;
    resolve_food(state, out);
    std::vector<Death> deaths;
    resolve_self(state, deaths);
    if (state.config.mode == Mode::duo && deaths.empty())
        resolve_inter(state, deaths);
    if (!deaths.empty())
        finish(state, deaths, out);
}

void CollisionResolver::resolve_food(MatchState &state, TickOutput &out)
{
    const auto &cfg = state.config;
    // Every snake in range of the food as it stood at the start of this step is rewarded; one respawn follows.
    const Vec2 food = state.food.position;
    uint32_t first_eater = 0;
    for (auto &s : state.snakes) {
        if (!s.alive || distance(s.head, food) >= cfg.pickup_radius)
            continue;
        s.score += cfg.food_reward;
        out.events.emplace_back(ScoreChanged{s.id, cfg.food_reward, s.score});
        s.target_length += cfg.growth_per_food;
        out.events.emplace_back(LengthChanged{s.id, cfg.growth_per_food, s.target_length});
        float before = state.speed;
        state.speed = speed_after_pickup(cfg, state.speed);
        if (state.speed != before) {
            out.events.emplace_back(SpeedChanged{before, state.speed, state.speed >= cfg.hard.max_speed});
            log::debug("[match] speed {} -> {}", before, state.speed);
        }
        metrics::runtime().food_pickups.fetch_add(1, std::memory_order_relaxed);
        if (first_eater == 0)
            first_eater = s.id;
    }
    if (first_eater == 0)
        return;
    auto placed = spawner_.place(state);
    state.food.position = placed.position;
    out.events.emplace_back(FoodRelocated{placed.position, first_eater, placed.attempts, placed.fallback});
    log::debug(
        "[food] eaten by={} tick={} new=({}, {}) attempts={}",
        first_eater,
        state.tick,
        placed.position.x,
        placed.position.y,
        placed.attempts);
}

void CollisionResolver::resolve_self(const MatchState &state, std::vector<Death> &deaths) const
{
    const auto &cfg = state.config;
    for (auto &s : state.snakes) {
        if (!s.alive)
            continue;
        const auto &segs = s.body.segments();
        for (size_t i = cfg.self_exempt_segments; i < segs.size(); ++i) {
            if (distance(s.head, segs[i]) < cfg.self_hit_radius) {
                deaths.push_back({s.id, DeathCause::self_hit});
                break;
            }
        }
    }
}

void CollisionResolver::resolve_inter(const MatchState &state, std::vector<Death> &deaths) const
{
    if (state.snakes.size() < 2)
        return;
    const Snake &a = state.snakes[0];
    const Snake &b = state.snakes[1];
    if (!a.alive || !b.alive)
        return;
    const auto &cfg = state.config;
    if (distance(a.head, b.head) < cfg.head_hit_radius) {
        deaths.push_back({a.id, DeathCause::head_on});
        deaths.push_back({b.id, DeathCause::head_on});
        return;
    }
    // Player 1 is tested first; when both heads touch the other body, only player 1 dies.
    if (head_touches_body(a, b, cfg.body_hit_radius))
        deaths.push_back({a.id, DeathCause::hit_opponent});
    else if (head_touches_body(b, a, cfg.body_hit_radius))
        deaths.push_back({b.id, DeathCause::hit_opponent});
}

void CollisionResolver::finish(MatchState &state, const std::vector<Death> &deaths, TickOutput &out) const
{
    for (auto &d : deaths) {
        if (Snake *s = state.find_snake(d.snake_id)) {
            s->alive = false;
            out.events.emplace_back(SnakeDied{d.snake_id, d.cause});
            log::info("[match] snake={} died cause={} tick={}", d.snake_id, to_string(d.cause), state.tick);
        }
    }
    MatchOutcome outcome;
    if (state.config.mode == Mode::single) {
        outcome.winner = Winner::none;
        outcome.reason = death_reason(state, deaths.front().snake_id, deaths.front().cause);
    } else if (deaths.size() >= 2) {
        outcome.winner = Winner::tie;
        bool head_on = std::any_of(
            deaths.begin(), deaths.end(), [](const Death &d) { return d.cause == DeathCause::head_on; });
        outcome.reason = head_on ? "Head-on collision!" : "Both players crashed!";
    } else {
        const Death &d = deaths.front();
        outcome.winner = Winner::snake;
        outcome.winner_id = d.snake_id == 1 ? 2 : 1;
        outcome.reason = death_reason(state, d.snake_id, d.cause);
    }
    state.status = MatchStatus::ended;
    state.outcome = outcome;
    out.events.emplace_back(MatchEnded{outcome});
    log::info(
        "[match] over tick={} winner={} id={} reason=\"{}\"",
        state.tick,
        to_string(outcome.winner),
        outcome.winner_id,
        outcome.reason);
}

} // namespace s2d::game
