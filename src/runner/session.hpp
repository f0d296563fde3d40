// SPDX-License-Identifier: Apache-2.0
// session.hpp - drives one or more consecutive matches on a libcoro io_scheduler
#pragma once
#include "game/match.hpp"
#include "runner/input_script.hpp"
#include "runner/replay.hpp"

#include <coro/coro.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace s2d::runner {

struct SessionOptions
{
    game::MatchConfig match; // match.seed is the seed of the first match; match k uses seed + k
    uint32_t matches{1};
    uint64_t max_ticks{0}; // per match, 0 = until the match ends on its own
    bool paced{true}; // false: ticks back-to-back without waiting
    const InputScript *script{nullptr};
    ReplayWriter *replay{nullptr};
    const std::atomic_bool *stop{nullptr}; // polled before every tick
};

struct MatchSummary
{
    uint32_t index{0};
    uint32_t seed{0};
    uint64_t ticks{0};
    game::MatchOutcome outcome;
    std::vector<uint32_t> scores; // by snake id - 1
};

struct SessionResult
{
    std::vector<MatchSummary> matches;
    bool interrupted{false};
};

coro::task<SessionResult> run_session(std::shared_ptr<coro::io_scheduler> scheduler, SessionOptions opts);

// Runs run_session on the default io executor and blocks until it completes.
SessionResult run_session_blocking(SessionOptions opts);

} // namespace s2d::runner
