// SPDX-License-Identifier: Apache-2.0
#include "game/config.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

namespace s2d::game {

namespace {

std::string lower(std::string_view s)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return v;
}

void apply_preset_overrides(DifficultyPreset &p, const YAML::Node &node)
{
    if (!node || !node.IsMap())
        return;
    if (node["speed"])
        p.speed = node["speed"].as<float>();
    if (node["rotation_speed"])
        p.rotation_speed = node["rotation_speed"].as<float>();
    if (node["speed_increment"])
        p.speed_increment = node["speed_increment"].as<float>();
    if (node["max_speed"])
        p.max_speed = node["max_speed"].as<float>();
}

void require(bool ok, const char *field)
{
    if (!ok)
        throw std::invalid_argument(std::string("invalid match config: ") + field);
}

void validate_preset(const DifficultyPreset &p, const char *name)
{
    std::string prefix(name);
    require(std::isfinite(p.speed) && p.speed >= 0.f, (prefix + ".speed").c_str());
    require(std::isfinite(p.rotation_speed) && p.rotation_speed >= 0.f, (prefix + ".rotation_speed").c_str());
    require(std::isfinite(p.speed_increment) && p.speed_increment >= 0.f, (prefix + ".speed_increment").c_str());
    require(std::isfinite(p.max_speed) && p.max_speed >= p.speed, (prefix + ".max_speed").c_str());
}

} // namespace

uint64_t ms_to_ticks(uint32_t ms, uint32_t tick_rate)
{
    return (static_cast<uint64_t>(ms) * tick_rate + 500u) / 1000u;
}

Mode parse_mode(std::string_view s)
{
    auto v = lower(s);
    if (v == "single")
        return Mode::single;
    if (v == "duo" || v == "multiplayer")
        return Mode::duo;
    throw std::invalid_argument("unknown mode '" + std::string(s) + "' (expected single|duo)");
}

Difficulty parse_difficulty(std::string_view s)
{
    auto v = lower(s);
    if (v == "easy")
        return Difficulty::easy;
    if (v == "hard")
        return Difficulty::hard;
    throw std::invalid_argument("unknown difficulty '" + std::string(s) + "' (expected easy|hard)");
}

const char *to_string(Mode m)
{
    return m == Mode::duo ? "duo" : "single";
}

const char *to_string(Difficulty d)
{
    return d == Difficulty::hard ? "hard" : "easy";
}

void validate(const MatchConfig &cfg)
{
    require(std::isfinite(cfg.world_width) && cfg.world_width > 0.f, "world_width");
    require(std::isfinite(cfg.world_height) && cfg.world_height > 0.f, "world_height");
    require(cfg.tick_rate > 0, "tick_rate");
    require(std::isfinite(cfg.segment_spacing) && cfg.segment_spacing > 0.f, "segment_spacing");
    require(cfg.initial_length > 0, "initial_length");
    validate_preset(cfg.easy, "easy");
    validate_preset(cfg.hard, "hard");
    require(cfg.pickup_radius >= 0.f, "pickup_radius");
    require(cfg.food_margin >= 0.f, "food_margin");
    require(cfg.world_width - 2.f * cfg.food_margin > 0.f, "food_margin (no width left to sample)");
    require(cfg.world_height - 2.f * cfg.food_margin > 0.f, "food_margin (no height left to sample)");
    require(cfg.food_head_exclusion >= 0.f, "food_head_exclusion");
    require(cfg.food_body_exclusion >= 0.f, "food_body_exclusion");
    require(cfg.food_max_attempts > 0, "food_max_attempts");
    require(cfg.self_hit_radius >= 0.f, "self_hit_radius");
    require(cfg.head_hit_radius >= 0.f, "head_hit_radius");
    require(cfg.body_hit_radius >= 0.f, "body_hit_radius");
    require(std::isfinite(cfg.projectile_speed) && cfg.projectile_speed >= 0.f, "projectile_speed");
    require(cfg.projectile_hit_radius >= 0.f, "projectile_hit_radius");
    require(std::isfinite(cfg.slow_factor) && cfg.slow_factor >= 0.f, "slow_factor");
}

void apply_match_config_overrides(MatchConfig &cfg, const YAML::Node &root)
{
    if (root["mode"])
        cfg.mode = parse_mode(root["mode"].as<std::string>());
    if (root["difficulty"])
        cfg.difficulty = parse_difficulty(root["difficulty"].as<std::string>());
    apply_preset_overrides(cfg.easy, root["easy"]);
    apply_preset_overrides(cfg.hard, root["hard"]);
    if (root["world_width"])
        cfg.world_width = root["world_width"].as<float>();
    if (root["world_height"])
        cfg.world_height = root["world_height"].as<float>();
    if (root["tick_rate"])
        cfg.tick_rate = root["tick_rate"].as<uint32_t>();
    if (root["segment_spacing"])
        cfg.segment_spacing = root["segment_spacing"].as<float>();
    if (root["initial_length"])
        cfg.initial_length = root["initial_length"].as<uint32_t>();
    if (root["pickup_radius"])
        cfg.pickup_radius = root["pickup_radius"].as<float>();
    if (root["food_reward"])
        cfg.food_reward = root["food_reward"].as<uint32_t>();
    if (root["growth_per_food"])
        cfg.growth_per_food = root["growth_per_food"].as<uint32_t>();
    if (root["food_margin"])
        cfg.food_margin = root["food_margin"].as<float>();
    if (root["food_head_exclusion"])
        cfg.food_head_exclusion = root["food_head_exclusion"].as<float>();
    if (root["food_body_exclusion"])
        cfg.food_body_exclusion = root["food_body_exclusion"].as<float>();
    if (root["food_max_attempts"])
        cfg.food_max_attempts = root["food_max_attempts"].as<uint32_t>();
    if (root["self_exempt_segments"])
        cfg.self_exempt_segments = root["self_exempt_segments"].as<uint32_t>();
    if (root["self_hit_radius"])
        cfg.self_hit_radius = root["self_hit_radius"].as<float>();
    if (root["head_hit_radius"])
        cfg.head_hit_radius = root["head_hit_radius"].as<float>();
    if (root["body_hit_radius"])
        cfg.body_hit_radius = root["body_hit_radius"].as<float>();
    if (root["projectile_speed"])
        cfg.projectile_speed = root["projectile_speed"].as<float>();
    if (root["projectile_hit_radius"])
        cfg.projectile_hit_radius = root["projectile_hit_radius"].as<float>();
    if (root["projectile_lifetime_ms"])
        cfg.projectile_lifetime_ms = root["projectile_lifetime_ms"].as<uint32_t>();
    if (root["shoot_cooldown_ms"])
        cfg.shoot_cooldown_ms = root["shoot_cooldown_ms"].as<uint32_t>();
    if (root["slow_duration_ms"])
        cfg.slow_duration_ms = root["slow_duration_ms"].as<uint32_t>();
    if (root["slow_factor"])
        cfg.slow_factor = root["slow_factor"].as<float>();
    if (root["seed"])
        cfg.seed = root["seed"].as<uint32_t>();
}

MatchConfig load_match_config(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    MatchConfig cfg;
    apply_match_config_overrides(cfg, root);
    return cfg;
}

} // namespace s2d::game
