// SPDX-License-Identifier: Apache-2.0
#include "game/match.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "game/projectiles.hpp"

#include <chrono>
#include <cmath>
#include <utility>

namespace s2d::game {

namespace {

MatchState make_initial_state(const MatchConfig &cfg)
{
    validate(cfg);
    MatchState st;
    st.config = cfg;
    st.plane = Plane{cfg.world_width, cfg.world_height};
    st.durations.projectile_lifetime = ms_to_ticks(cfg.projectile_lifetime_ms, cfg.tick_rate);
    st.durations.shoot_cooldown = ms_to_ticks(cfg.shoot_cooldown_ms, cfg.tick_rate);
    st.durations.slow = ms_to_ticks(cfg.slow_duration_ms, cfg.tick_rate);
    st.speed = cfg.preset().speed;
    const float mid_y = cfg.world_height * 0.5f;
    st.snakes.push_back(
        spawn_snake(1, st.plane, {cfg.world_width * 0.25f, mid_y}, 0.f, cfg.segment_spacing, cfg.initial_length));
    if (cfg.mode == Mode::duo) {
        st.snakes.push_back(spawn_snake(
            2, st.plane, {cfg.world_width * 0.75f, mid_y}, (float)M_PI, cfg.segment_spacing, cfg.initial_length));
    }
    return st;
}

} // namespace

Match::Match(const MatchConfig &cfg)
    : state_(make_initial_state(cfg))
    , spawner_(state_.config, state_.config.seed)
    , resolver_(spawner_)
{
    initial_food_ = spawner_.place(state_);
    const auto &placed = initial_food_;
    state_.food.position = placed.position;
    auto &rt = metrics::runtime();
    rt.matches_started.fetch_add(1, std::memory_order_relaxed);
    rt.active_matches.fetch_add(1, std::memory_order_relaxed);
    log::info(
        "[match] start mode={} difficulty={} world={}x{} snakes={} speed={} seed={} food=({}, {})",
        to_string(cfg.mode),
        to_string(cfg.difficulty),
        cfg.world_width,
        cfg.world_height,
        state_.snakes.size(),
        state_.speed,
        cfg.seed,
        placed.position.x,
        placed.position.y);
}

Match::~Match()
{
    if (state_.status == MatchStatus::running)
        metrics::runtime().active_matches.fetch_sub(1, std::memory_order_relaxed);
}

TickOutput Match::tick(const PlayerInputs &inputs)
{
    TickOutput out;
    if (state_.status == MatchStatus::ended) {
        out.tick = state_.tick;
        out.status = state_.status;
        return out;
    }
    using clock = std::chrono::steady_clock;
    auto tick_start = clock::now();
    auto &st = state_;
    const auto &cfg = st.config;
    out.tick = ++st.tick;

    const float rotation = cfg.preset().rotation_speed;
    for (auto &s : st.snakes) {
        if (s.alive)
            steer(s, inputs[s.id - 1], rotation);
    }
    for (auto &s : st.snakes) {
        if (s.alive)
            advance(s, st.plane, effective_speed(s, st.speed, cfg.slow_factor, st.tick));
    }
    if (cfg.mode == Mode::duo) {
        for (auto &s : st.snakes) {
            if (s.alive && inputs[s.id - 1].fire)
                try_fire(st, s, out);
        }
        advance_projectiles(st, out);
        resolve_projectile_hits(st, out);
    }
    resolver_.resolve(st, out);
    out.status = st.status;
    if (st.status == MatchStatus::ended)
        on_ended();

    S2D_LOG_EVERY_N_TICKS(
        trace,
        st.tick,
        cfg.tick_rate,
        "[match] tick={} speed={} food=({}, {}) projectiles={} head1=({}, {}) len1={}",
        st.tick,
        st.speed,
        st.food.position.x,
        st.food.position.y,
        st.projectiles.size(),
        st.snakes[0].head.x,
        st.snakes[0].head.y,
        st.snakes[0].body.size());
    auto tick_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - tick_start).count();
    metrics::add_tick_duration(static_cast<uint64_t>(tick_ns));
    return out;
}

bool Match::end(std::string reason)
{
    if (state_.status == MatchStatus::ended)
        return false;
    state_.status = MatchStatus::ended;
    state_.outcome = MatchOutcome{Winner::none, 0, std::move(reason)};
    log::info("[match] ended by host tick={} reason=\"{}\"", state_.tick, state_.outcome.reason);
    on_ended();
    return true;
}

void Match::on_ended()
{
    auto &rt = metrics::runtime();
    rt.matches_completed.fetch_add(1, std::memory_order_relaxed);
    rt.active_matches.fetch_sub(1, std::memory_order_relaxed);
    rt.projectiles_active.store(0, std::memory_order_relaxed);
}

} // namespace s2d::game
