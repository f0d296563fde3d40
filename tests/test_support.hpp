// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "game/match.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

namespace s2d::test {

inline bool near(float a, float b, float eps = 1e-3f)
{
    return std::fabs(a - b) <= eps;
}

inline game::MatchConfig duo_config()
{
    game::MatchConfig cfg;
    cfg.mode = game::Mode::duo;
    return cfg;
}

// Replaces snake `id` with a freshly spawned one (straight body, default length).
inline void place_snake(game::MatchState &st, uint32_t id, game::Vec2 head, float angle)
{
    st.snakes[id - 1] =
        game::spawn_snake(id, st.plane, head, angle, st.config.segment_spacing, st.config.initial_length);
}

// Keeps the food somewhere no snake in the scenario will reach.
inline void park_food(game::MatchState &st, game::Vec2 pos = {300.f, 40.f})
{
    st.food.position = pos;
}

inline game::PlayerInputs no_input()
{
    return game::PlayerInputs{};
}

inline game::PlayerInputs hold(uint32_t player, bool left, bool right, bool fire)
{
    game::PlayerInputs in{};
    in[player - 1] = game::InputState{left, right, fire};
    return in;
}

// Writes `content` into a file under the system temp directory and returns its path.
inline std::string write_temp_file(const std::string &name, const std::string &content)
{
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream f(path, std::ios::trunc);
    f << content;
    return path.string();
}

} // namespace s2d::test
