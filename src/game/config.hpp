// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace s2d::game {

enum class Mode
{
    single,
    duo
};

enum class Difficulty
{
    easy,
    hard
};

struct DifficultyPreset
{
    float speed{2.5f}; // units per tick at match start
    float rotation_speed{0.07f}; // radians per tick while a turn key is held
    float speed_increment{0.0f}; // added to the shared speed on every pickup
    float max_speed{2.5f};
};

inline constexpr DifficultyPreset kEasyPreset{2.5f, 0.07f, 0.0f, 2.5f};
inline constexpr DifficultyPreset kHardPreset{5.0f, 0.14f, 0.15f, 12.0f};

struct MatchConfig
{
    Mode mode{Mode::single};
    Difficulty difficulty{Difficulty::easy};
    DifficultyPreset easy{kEasyPreset};
    DifficultyPreset hard{kHardPreset};
    float world_width{600.f};
    float world_height{600.f};
    uint32_t tick_rate{60};
    // Body
    float segment_spacing{8.f};
    uint32_t initial_length{15};
    // Food
    float pickup_radius{15.f};
    uint32_t food_reward{10};
    uint32_t growth_per_food{5};
    float food_margin{20.f}; // sampling rectangle inset from every edge
    float food_head_exclusion{50.f};
    float food_body_exclusion{30.f};
    uint32_t food_max_attempts{1000}; // rejection draws before the grid fallback
    // Collisions
    uint32_t self_exempt_segments{5}; // head-adjacent segments never tested for self-hits
    float self_hit_radius{6.f};
    float head_hit_radius{10.f};
    float body_hit_radius{6.f};
    // Projectiles (duo only); durations are converted to ticks with tick_rate
    float projectile_speed{8.f};
    float projectile_hit_radius{10.f};
    uint32_t projectile_lifetime_ms{1500};
    uint32_t shoot_cooldown_ms{1000};
    uint32_t slow_duration_ms{1000};
    float slow_factor{0.f};
    // Food placement RNG seed
    uint32_t seed{1};

    const DifficultyPreset &preset() const { return difficulty == Difficulty::hard ? hard : easy; }
    uint32_t snake_count() const { return mode == Mode::duo ? 2u : 1u; }
};

uint64_t ms_to_ticks(uint32_t ms, uint32_t tick_rate);

Mode parse_mode(std::string_view s);
Difficulty parse_difficulty(std::string_view s);
const char *to_string(Mode m);
const char *to_string(Difficulty d);

// Throws std::invalid_argument naming the first offending field.
void validate(const MatchConfig &cfg);

// Only keys present in the node override the current values.
void apply_match_config_overrides(MatchConfig &cfg, const YAML::Node &root);
// Throws YAML::Exception on unreadable or malformed files.
MatchConfig load_match_config(const std::string &path);

} // namespace s2d::game
