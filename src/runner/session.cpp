// SPDX-License-Identifier: Apache-2.0
#include "runner/session.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/default_executor.hpp>

#include <chrono>
#include <utility>

namespace s2d::runner {

namespace {

bool stop_requested(const SessionOptions &opts)
{
    return opts.stop && opts.stop->load();
}

MatchSummary summarize(const game::Match &m, uint32_t index)
{
    MatchSummary sum;
    const auto &st = m.state();
    sum.index = index;
    sum.seed = st.config.seed;
    sum.ticks = st.tick;
    sum.outcome = st.outcome;
    for (auto &s : st.snakes)
        sum.scores.push_back(s.score);
    return sum;
}

void record_initial(const game::Match &m, uint32_t index, ReplayWriter &replay)
{
    replay.write_header(make_header(m.state().config, index));
    game::TickOutput initial;
    initial.tick = 0;
    const auto &placed = m.initial_food();
    initial.events.emplace_back(game::FoodRelocated{placed.position, 0, placed.attempts, placed.fallback});
    replay.write_tick(make_tick_record(m.state(), game::PlayerInputs{}, initial));
}

} // namespace

coro::task<SessionResult> run_session(std::shared_ptr<coro::io_scheduler> scheduler, SessionOptions opts)
{
    co_await scheduler->schedule();
    // The tick interval below divides by tick_rate.
    game::validate(opts.match);
    SessionResult result;
    using clock = std::chrono::steady_clock;
    const InputScript empty_script;
    const InputScript &script = opts.script ? *opts.script : empty_script;
    const auto tick_interval =
        std::chrono::nanoseconds((1'000'000'000ull + opts.match.tick_rate / 2) / opts.match.tick_rate);

    for (uint32_t index = 0; index < opts.matches && !result.interrupted; ++index) {
        game::MatchConfig cfg = opts.match;
        cfg.seed = opts.match.seed + index;
        game::Match match(cfg);
        if (opts.replay)
            record_initial(match, index, *opts.replay);
        log::info("[session] match {}/{} seed={} paced={}", index + 1, opts.matches, cfg.seed, opts.paced);

        auto next = clock::now();
        while (!match.over()) {
            if (stop_requested(opts)) {
                match.end("Session interrupted");
                result.interrupted = true;
                break;
            }
            if (opts.max_ticks > 0 && match.state().tick >= opts.max_ticks) {
                match.end("Tick limit reached");
                break;
            }
            if (opts.paced) {
                auto now = clock::now();
                if (now < next) {
                    auto wait_dur = next - now;
                    metrics::add_wait_duration(
                        std::chrono::duration_cast<std::chrono::nanoseconds>(wait_dur).count());
                    co_await scheduler->yield_for(wait_dur);
                    continue;
                }
                if (now - next > tick_interval)
                    metrics::runtime().late_ticks.fetch_add(1, std::memory_order_relaxed);
                next += tick_interval;
            }
            auto inputs = script.sample(match.state().tick + 1);
            auto out = match.tick(inputs);
            if (opts.replay)
                opts.replay->write_tick(make_tick_record(match.state(), inputs, out));
        }

        auto sum = summarize(match, index);
        log::info(
            "[session] match {} done ticks={} winner={} id={} reason=\"{}\"",
            index + 1,
            sum.ticks,
            game::to_string(sum.outcome.winner),
            sum.outcome.winner_id,
            sum.outcome.reason);
        result.matches.push_back(std::move(sum));
    }
    co_return result;
}

SessionResult run_session_blocking(SessionOptions opts)
{
    auto scheduler = coro::default_executor::io_executor();
    return coro::sync_wait(run_session(scheduler, std::move(opts)));
}

} // namespace s2d::runner
