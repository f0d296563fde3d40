// SPDX-License-Identifier: Apache-2.0
// Headless match runner: loads a match config, drives matches at the configured tick rate and
// optionally records a replay stream.
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "runner/input_script.hpp"
#include "runner/replay.hpp"
#include "runner/runner_config.hpp"
#include "runner/session.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <random>
#include <stdexcept>

namespace s2d {
std::atomic_bool g_shutdown{false};
}

static void handle_signal(int)
{
    s2d::g_shutdown.store(true);
}

int main(int argc, char **argv)
{
    s2d::runner::RunnerConfig cfg;
    std::optional<s2d::runner::InputScript> script;
    std::ofstream replay_file;
    std::optional<s2d::runner::ReplayWriter> replay;
    try {
        auto cli = s2d::runner::parse_cli(argc, argv);
        cfg = s2d::runner::load_runner_config(cli.config_path);
        s2d::runner::apply_cli(cfg, cli);
        s2d::game::validate(cfg.match);
        if (!cfg.input_path.empty())
            script = s2d::runner::load_input_script(cfg.input_path);
        if (!cfg.replay_path.empty()) {
            replay_file.open(cfg.replay_path, std::ios::binary | std::ios::trunc);
            if (!replay_file)
                throw std::runtime_error("cannot open replay file " + cfg.replay_path);
            replay.emplace(replay_file);
        }
    } catch (const std::exception &ex) {
        s2d::log::error("Failed to load config: {}", ex.what());
        return 1;
    }

    // An explicit S2D_LOG_LEVEL wins over the config file.
    if (!cfg.log_level.empty() && std::getenv("S2D_LOG_LEVEL") == nullptr)
        s2d::log::set_level(cfg.log_level);
    if (cfg.log_json)
        s2d::log::set_json(true);
    s2d::log::init();

    if (cfg.match.seed == 0) {
        cfg.match.seed = std::random_device{}();
        s2d::log::info("Seed 0 requested, using random seed {}", cfg.match.seed);
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    s2d::log::info(
        "s2d runner starting mode={} difficulty={} tick_rate={} matches={} max_ticks={} paced={}",
        s2d::game::to_string(cfg.match.mode),
        s2d::game::to_string(cfg.match.difficulty),
        cfg.match.tick_rate,
        cfg.matches,
        cfg.max_ticks,
        cfg.paced);

    s2d::runner::SessionOptions opts;
    opts.match = cfg.match;
    opts.matches = cfg.matches;
    opts.max_ticks = cfg.max_ticks;
    opts.paced = cfg.paced;
    opts.script = script ? &*script : nullptr;
    opts.replay = replay ? &*replay : nullptr;
    opts.stop = &s2d::g_shutdown;

    s2d::runner::SessionResult result;
    try {
        result = s2d::runner::run_session_blocking(opts);
    } catch (const std::exception &ex) {
        s2d::log::error("Session failed: {}", ex.what());
        return 1;
    }

    for (auto &m : result.matches) {
        if (m.scores.size() > 1) {
            s2d::log::info(
                "match {} seed={} ticks={} scores={}/{} reason=\"{}\"",
                m.index + 1,
                m.seed,
                m.ticks,
                m.scores[0],
                m.scores[1],
                m.outcome.reason);
        } else {
            s2d::log::info(
                "match {} seed={} ticks={} score={} reason=\"{}\"",
                m.index + 1,
                m.seed,
                m.ticks,
                m.scores.empty() ? 0u : m.scores[0],
                m.outcome.reason);
        }
    }
    if (replay) {
        replay_file.flush();
        s2d::log::info(
            "Replay written: {} records, {} bytes -> {}",
            replay->records_written(),
            replay->bytes_written(),
            cfg.replay_path);
    }
    if (result.interrupted)
        s2d::log::info("Signal received, session interrupted");
    s2d::log::info("{}", s2d::metrics::runtime_json("runtime"));
    return 0;
}
