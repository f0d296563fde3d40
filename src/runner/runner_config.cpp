// SPDX-License-Identifier: Apache-2.0
#include "runner/runner_config.hpp"

#include <limits>
#include <stdexcept>

namespace s2d::runner {

namespace {

template <typename T>
T parse_number(const std::string &flag, const std::string &value)
{
    try {
        size_t used = 0;
        auto v = std::stoull(value, &used);
        if (used != value.size() || value[0] == '-' || v > std::numeric_limits<T>::max())
            throw std::invalid_argument(value);
        return static_cast<T>(v);
    } catch (const std::logic_error &) {
        throw std::invalid_argument("invalid value '" + value + "' for " + flag);
    }
}

} // namespace

CliOptions parse_cli(int argc, const char *const *argv)
{
    CliOptions cli;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&]() -> std::string
        {
            if (i + 1 >= argc)
                throw std::invalid_argument("missing value for " + a);
            return argv[++i];
        };
        if (a == "--mode") {
            cli.mode = value();
        } else if (a == "--difficulty") {
            cli.difficulty = value();
        } else if (a == "--seed") {
            cli.seed = parse_number<uint32_t>(a, value());
        } else if (a == "--max-ticks") {
            cli.max_ticks = parse_number<uint64_t>(a, value());
        } else if (a == "--matches") {
            cli.matches = parse_number<uint32_t>(a, value());
        } else if (a == "--replay") {
            cli.replay_path = value();
        } else if (a == "--input") {
            cli.input_path = value();
        } else if (a == "--fast") {
            cli.fast = true;
        } else if (!a.empty() && a[0] != '-') {
            cli.config_path = a;
        } else {
            throw std::invalid_argument("unknown option " + a);
        }
    }
    return cli;
}

void apply_runner_overrides(RunnerConfig &cfg, const YAML::Node &root)
{
    game::apply_match_config_overrides(cfg.match, root);
    if (root["log_level"])
        cfg.log_level = root["log_level"].as<std::string>();
    if (root["log_json"])
        cfg.log_json = root["log_json"].as<bool>();
    if (root["paced"])
        cfg.paced = root["paced"].as<bool>();
    if (root["max_ticks"])
        cfg.max_ticks = root["max_ticks"].as<uint64_t>();
    if (root["matches"])
        cfg.matches = root["matches"].as<uint32_t>();
    if (root["replay_path"])
        cfg.replay_path = root["replay_path"].as<std::string>();
    if (root["input_path"])
        cfg.input_path = root["input_path"].as<std::string>();
}

RunnerConfig load_runner_config(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    RunnerConfig cfg;
    apply_runner_overrides(cfg, root);
    return cfg;
}

void apply_cli(RunnerConfig &cfg, const CliOptions &cli)
{
    if (cli.mode)
        cfg.match.mode = game::parse_mode(*cli.mode);
    if (cli.difficulty)
        cfg.match.difficulty = game::parse_difficulty(*cli.difficulty);
    if (cli.seed)
        cfg.match.seed = *cli.seed;
    if (cli.max_ticks)
        cfg.max_ticks = *cli.max_ticks;
    if (cli.matches)
        cfg.matches = *cli.matches;
    if (cli.replay_path)
        cfg.replay_path = *cli.replay_path;
    if (cli.input_path)
        cfg.input_path = *cli.input_path;
    if (cli.fast)
        cfg.paced = false;
    if (cfg.matches == 0)
        throw std::invalid_argument("matches must be at least 1");
}

} // namespace s2d::runner
