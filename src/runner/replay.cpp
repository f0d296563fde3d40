// SPDX-License-Identifier: Apache-2.0
#include "runner/replay.hpp"

#include "common/logger.hpp"

#include <stdexcept>
#include <type_traits>

namespace s2d::runner {

namespace {

void set_vec(::s2d::Vec2 *out, const game::Vec2 &v)
{
    out->set_x(v.x);
    out->set_y(v.y);
}

::s2d::DeathCause to_proto(game::DeathCause c)
{
    switch (c) {
        case game::DeathCause::self_hit:
            return ::s2d::DEATH_SELF_HIT;
        case game::DeathCause::head_on:
            return ::s2d::DEATH_HEAD_ON;
        case game::DeathCause::hit_opponent:
            return ::s2d::DEATH_HIT_OPPONENT;
        case game::DeathCause::none:
            break;
    }
    return ::s2d::DEATH_NONE;
}

::s2d::WinnerKind to_proto(game::Winner w)
{
    switch (w) {
        case game::Winner::snake:
            return ::s2d::WINNER_SNAKE;
        case game::Winner::tie:
            return ::s2d::WINNER_TIE;
        case game::Winner::none:
            break;
    }
    return ::s2d::WINNER_NONE;
}

void fill_outcome(const game::MatchOutcome &o, ::s2d::MatchOutcome *out)
{
    out->set_winner(to_proto(o.winner));
    out->set_winner_id(o.winner_id);
    out->set_reason(o.reason);
}

} // namespace

::s2d::ReplayHeader make_header(const game::MatchConfig &cfg, uint32_t match_index)
{
    ::s2d::ReplayHeader h;
    h.set_format_version(kReplayFormatVersion);
    h.set_mode(cfg.mode == game::Mode::duo ? ::s2d::GAME_MODE_DUO : ::s2d::GAME_MODE_SINGLE);
    h.set_difficulty(cfg.difficulty == game::Difficulty::hard ? ::s2d::DIFFICULTY_HARD : ::s2d::DIFFICULTY_EASY);
    h.set_world_width(cfg.world_width);
    h.set_world_height(cfg.world_height);
    h.set_tick_rate(cfg.tick_rate);
    h.set_seed(cfg.seed);
    h.set_match_index(match_index);
    h.set_snake_count(cfg.snake_count());
    h.set_segment_spacing(cfg.segment_spacing);
    h.set_initial_length(cfg.initial_length);
    return h;
}

void fill_snapshot(const game::MatchState &state, ::s2d::Snapshot *snap)
{
    for (auto &s : state.snakes) {
        auto *ss = snap->add_snakes();
        ss->set_snake_id(s.id);
        set_vec(ss->mutable_head(), s.head);
        ss->set_angle(s.angle);
        ss->set_target_angle(s.target_angle);
        for (auto &seg : s.body.segments())
            set_vec(ss->add_segments(), seg);
        ss->set_target_length(s.target_length);
        ss->set_score(s.score);
        ss->set_alive(s.alive);
        ss->set_slow_until_tick(s.slow_until_tick);
        ss->set_shoot_cooldown_until_tick(s.shoot_cooldown_until_tick);
    }
    set_vec(snap->mutable_food(), state.food.position);
    for (auto &p : state.projectiles) {
        auto *ps = snap->add_projectiles();
        ps->set_projectile_id(p.id);
        ps->set_owner(p.owner);
        set_vec(ps->mutable_position(), p.position);
        set_vec(ps->mutable_velocity(), p.velocity);
        ps->set_spawn_tick(p.spawn_tick);
    }
    snap->set_speed(state.speed);
    if (state.status == game::MatchStatus::ended) {
        snap->set_status(::s2d::MATCH_ENDED);
        fill_outcome(state.outcome, snap->mutable_outcome());
    } else {
        snap->set_status(::s2d::MATCH_RUNNING);
    }
}

void fill_event(const game::Event &ev, ::s2d::GameEvent *out)
{
    std::visit(
        [out](const auto &e)
        {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, game::ProjectileFired>) {
                auto *m = out->mutable_projectile_fired();
                m->set_projectile_id(e.projectile_id);
                m->set_owner(e.owner);
                set_vec(m->mutable_origin(), e.origin);
                set_vec(m->mutable_velocity(), e.velocity);
            } else if constexpr (std::is_same_v<T, game::ProjectileExpired>) {
                auto *m = out->mutable_projectile_expired();
                m->set_projectile_id(e.projectile_id);
                m->set_owner(e.owner);
            } else if constexpr (std::is_same_v<T, game::ProjectileHit>) {
                auto *m = out->mutable_projectile_hit();
                m->set_projectile_id(e.projectile_id);
                m->set_owner(e.owner);
                m->set_victim(e.victim);
                m->set_slow_until_tick(e.slow_until_tick);
            } else if constexpr (std::is_same_v<T, game::ScoreChanged>) {
                auto *m = out->mutable_score_changed();
                m->set_snake_id(e.snake_id);
                m->set_delta(e.delta);
                m->set_total(e.total);
            } else if constexpr (std::is_same_v<T, game::LengthChanged>) {
                auto *m = out->mutable_length_changed();
                m->set_snake_id(e.snake_id);
                m->set_delta(e.delta);
                m->set_target_length(e.target_length);
            } else if constexpr (std::is_same_v<T, game::SpeedChanged>) {
                auto *m = out->mutable_speed_changed();
                m->set_previous(e.previous);
                m->set_current(e.current);
                m->set_capped(e.capped);
            } else if constexpr (std::is_same_v<T, game::FoodRelocated>) {
                auto *m = out->mutable_food_relocated();
                set_vec(m->mutable_position(), e.position);
                m->set_eaten_by(e.eaten_by);
                m->set_attempts(e.attempts);
                m->set_fallback(e.fallback);
            } else if constexpr (std::is_same_v<T, game::SnakeDied>) {
                auto *m = out->mutable_snake_died();
                m->set_snake_id(e.snake_id);
                m->set_cause(to_proto(e.cause));
            } else if constexpr (std::is_same_v<T, game::MatchEnded>) {
                fill_outcome(e.outcome, out->mutable_match_ended()->mutable_outcome());
            }
        },
        ev);
}

::s2d::TickRecord make_tick_record(
    const game::MatchState &state, const game::PlayerInputs &inputs, const game::TickOutput &out)
{
    ::s2d::TickRecord rec;
    rec.set_tick(out.tick);
    for (auto &s : state.snakes) {
        const auto &in = inputs[s.id - 1];
        auto *pi = rec.add_inputs();
        pi->set_snake_id(s.id);
        pi->set_turn_left(in.turn_left);
        pi->set_turn_right(in.turn_right);
        pi->set_fire(in.fire);
    }
    fill_snapshot(state, rec.mutable_snapshot());
    for (auto &ev : out.events)
        fill_event(ev, rec.add_events());
    return rec;
}

void ReplayWriter::write_header(const ::s2d::ReplayHeader &header)
{
    ::s2d::ReplayRecord rec;
    *rec.mutable_header() = header;
    write_record(rec);
}

void ReplayWriter::write_tick(const ::s2d::TickRecord &record)
{
    ::s2d::ReplayRecord rec;
    *rec.mutable_tick() = record;
    write_record(rec);
}

void ReplayWriter::write_record(const ::s2d::ReplayRecord &rec)
{
    if (!rec.SerializeToString(&scratch_))
        throw std::runtime_error("replay: serialize failed");
    if (scratch_.empty() || scratch_.size() > framing::kMaxFrameBytes)
        throw std::runtime_error("replay: record size out of range");
    auto frame = framing::build_frame(scratch_);
    out_.write(frame.data(), static_cast<std::streamsize>(frame.size()));
    if (!out_)
        throw std::runtime_error("replay: write failed");
    ++records_;
    bytes_ += frame.size();
}

bool ReplayReader::next(::s2d::ReplayRecord &rec)
{
    char chunk[4096];
    for (;;) {
        switch (framing::try_extract(st_, payload_)) {
            case framing::extract_status::frame:
                if (!rec.ParseFromString(payload_))
                    throw std::runtime_error("replay: malformed record");
                return true;
            case framing::extract_status::invalid:
                throw std::runtime_error("replay: invalid frame length");
            case framing::extract_status::need_more:
                break;
        }
        in_.read(chunk, sizeof(chunk));
        auto got = in_.gcount();
        if (got <= 0) {
            if (st_.buffer.empty())
                return false;
            log::warn("[replay] truncated stream, {} trailing bytes", st_.buffer.size());
            throw std::runtime_error("replay: truncated stream");
        }
        st_.feed(chunk, static_cast<size_t>(got));
    }
}

} // namespace s2d::runner
