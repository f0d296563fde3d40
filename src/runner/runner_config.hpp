// SPDX-License-Identifier: Apache-2.0
#pragma once
#include "game/config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>

namespace s2d::runner {

struct RunnerConfig
{
    game::MatchConfig match; // match.seed == 0 asks for a nondeterministic seed
    std::string log_level{"info"};
    bool log_json{false};
    bool paced{true};
    uint64_t max_ticks{0};
    uint32_t matches{1};
    std::string replay_path; // empty disables the replay stream
    std::string input_path; // empty: no keys held
};

// Command line: first non-flag argument is the config path.
struct CliOptions
{
    std::string config_path{"config/match.yaml"};
    std::optional<std::string> mode;
    std::optional<std::string> difficulty;
    std::optional<uint32_t> seed;
    std::optional<uint64_t> max_ticks;
    std::optional<uint32_t> matches;
    std::optional<std::string> replay_path;
    std::optional<std::string> input_path;
    bool fast{false};
};

// Throws std::invalid_argument on an unknown flag, a missing value or a non-numeric value.
CliOptions parse_cli(int argc, const char *const *argv);

void apply_runner_overrides(RunnerConfig &cfg, const YAML::Node &root);
RunnerConfig load_runner_config(const std::string &path);
void apply_cli(RunnerConfig &cfg, const CliOptions &cli);

} // namespace s2d::runner
