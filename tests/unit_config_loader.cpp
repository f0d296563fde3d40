// SPDX-License-Identifier: Apache-2.0
// unit_config_loader.cpp
// YAML match/runner configuration, validation and command line overrides.
#include "game/config.hpp"
#include "game/match.hpp"
#include "runner/runner_config.hpp"
#include "test_support.hpp"

#include <yaml-cpp/yaml.h>

#include <cassert>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

using namespace s2d::game;
using namespace s2d::runner;

template <typename F>
static bool throws_invalid(F &&f, const std::string &needle = "")
{
    try {
        f();
    } catch (const std::invalid_argument &ex) {
        return needle.empty() || std::string(ex.what()).find(needle) != std::string::npos;
    }
    return false;
}

static void defaults()
{
    MatchConfig cfg;
    validate(cfg);
    assert(cfg.mode == Mode::single && cfg.difficulty == Difficulty::easy);
    assert(cfg.world_width == 600.f && cfg.world_height == 600.f && cfg.tick_rate == 60);
    assert(cfg.preset().speed == 2.5f && cfg.preset().rotation_speed == 0.07f);
    assert(ms_to_ticks(cfg.projectile_lifetime_ms, cfg.tick_rate) == 90);
    assert(ms_to_ticks(cfg.shoot_cooldown_ms, cfg.tick_rate) == 60);
    assert(ms_to_ticks(1000, 30) == 30);
    assert(ms_to_ticks(25, 60) == 2); // 1.5 rounds up
    assert(cfg.snake_count() == 1);
}

static void yaml_overrides()
{
    auto path = s2d::test::write_temp_file(
        "s2d_unit_config.yaml",
        "mode: multiplayer\n"
        "difficulty: HARD\n"
        "world_width: 800\n"
        "hard:\n"
        "  max_speed: 9.5\n"
        "food_max_attempts: 25\n"
        "seed: 77\n");
    auto cfg = load_match_config(path);
    assert(cfg.mode == Mode::duo && cfg.snake_count() == 2);
    assert(cfg.difficulty == Difficulty::hard);
    assert(cfg.world_width == 800.f && cfg.world_height == 600.f);
    assert(cfg.hard.max_speed == 9.5f && cfg.hard.speed == 5.f && cfg.hard.speed_increment == 0.15f);
    assert(cfg.preset().max_speed == 9.5f);
    assert(cfg.food_max_attempts == 25 && cfg.seed == 77);
    validate(cfg);

    // Shipped defaults load and validate.
    auto shipped = load_runner_config(std::string(S2D_TEST_DATA_DIR) + "/match.yaml");
    validate(shipped.match);
    assert(shipped.match.mode == Mode::duo);
    assert(shipped.matches >= 1);
}

static void rejects_bad_values()
{
    assert(throws_invalid([] { parse_mode("triple"); }));
    assert(throws_invalid([] { parse_difficulty("medium"); }));
    assert(parse_mode("Duo") == Mode::duo);

    MatchConfig cfg;
    cfg.world_width = 0.f;
    assert(throws_invalid([&] { validate(cfg); }, "world_width"));
    cfg = MatchConfig{};
    cfg.tick_rate = 0;
    assert(throws_invalid([&] { validate(cfg); }, "tick_rate"));
    cfg = MatchConfig{};
    cfg.food_margin = 300.f;
    assert(throws_invalid([&] { validate(cfg); }, "food_margin"));
    cfg = MatchConfig{};
    cfg.initial_length = 0;
    assert(throws_invalid([&] { validate(cfg); }, "initial_length"));
    cfg = MatchConfig{};
    cfg.hard.max_speed = 1.f;
    assert(throws_invalid([&] { validate(cfg); }, "hard.max_speed"));
    cfg = MatchConfig{};
    cfg.food_max_attempts = 0;
    assert(throws_invalid([&] { Match m(cfg); }, "food_max_attempts"));

    auto bad_mode = s2d::test::write_temp_file("s2d_bad_mode.yaml", "mode: chess\n");
    assert(throws_invalid([&] { load_match_config(bad_mode); }, "chess"));

    auto malformed = s2d::test::write_temp_file("s2d_malformed.yaml", "world_width: [1, 2\n");
    bool yaml_error = false;
    try {
        load_match_config(malformed);
    } catch (const YAML::Exception &) {
        yaml_error = true;
    }
    assert(yaml_error);
    bool missing = false;
    try {
        load_match_config("/nonexistent/s2d.yaml");
    } catch (const YAML::Exception &) {
        missing = true;
    }
    assert(missing);
}

static void runner_and_cli()
{
    auto path = s2d::test::write_temp_file(
        "s2d_runner.yaml",
        "log_level: debug\n"
        "paced: true\n"
        "max_ticks: 500\n"
        "matches: 2\n"
        "replay_path: /tmp/r.bin\n"
        "tick_rate: 30\n");
    auto cfg = load_runner_config(path);
    assert(cfg.log_level == "debug" && cfg.paced && cfg.max_ticks == 500 && cfg.matches == 2);
    assert(cfg.replay_path == "/tmp/r.bin" && cfg.input_path.empty());
    assert(cfg.match.tick_rate == 30);

    const char *argv[] = {
        "s2d_sim", "custom.yaml", "--mode", "duo", "--difficulty", "hard", "--seed", "9", "--max-ticks", "100",
        "--matches", "3", "--fast", "--input", "in.yaml"};
    auto cli = parse_cli(static_cast<int>(std::size(argv)), argv);
    assert(cli.config_path == "custom.yaml");
    assert(cli.fast && cli.seed && *cli.seed == 9);
    apply_cli(cfg, cli);
    assert(cfg.match.mode == Mode::duo && cfg.match.difficulty == Difficulty::hard);
    assert(cfg.match.seed == 9 && cfg.max_ticks == 100 && cfg.matches == 3);
    assert(!cfg.paced && cfg.input_path == "in.yaml" && cfg.replay_path == "/tmp/r.bin");

    const char *none[] = {"s2d_sim"};
    assert(parse_cli(1, none).config_path == "config/match.yaml");
    const char *unknown[] = {"s2d_sim", "--turbo"};
    assert(throws_invalid([&] { parse_cli(2, unknown); }, "--turbo"));
    const char *nan_seed[] = {"s2d_sim", "--seed", "abc"};
    assert(throws_invalid([&] { parse_cli(3, nan_seed); }, "--seed"));
    const char *negative[] = {"s2d_sim", "--matches", "-1"};
    assert(throws_invalid([&] { parse_cli(3, negative); }));
    const char *dangling[] = {"s2d_sim", "--mode"};
    assert(throws_invalid([&] { parse_cli(2, dangling); }, "missing value"));
    const char *zero[] = {"s2d_sim", "--matches", "0"};
    RunnerConfig rc;
    assert(throws_invalid([&] { apply_cli(rc, parse_cli(3, zero)); }));
}

int main()
{
    defaults();
    yaml_overrides();
    rejects_bad_values();
    runner_and_cli();
    std::cout << "unit_config_loader OK" << std::endl;
    return 0;
}
