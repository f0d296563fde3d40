// SPDX-License-Identifier: Apache-2.0
#include "game/match_state.hpp"

namespace s2d::game {

const char *to_string(MatchStatus s)
{
    return s == MatchStatus::ended ? "ended" : "running";
}

const char *to_string(Winner w)
{
    switch (w) {
        case Winner::none:
            return "none";
        case Winner::snake:
            return "snake";
        case Winner::tie:
            return "tie";
    }
    return "none";
}

const char *to_string(DeathCause c)
{
    switch (c) {
        case DeathCause::none:
            return "none";
        case DeathCause::self_hit:
            return "self_hit";
        case DeathCause::head_on:
            return "head_on";
        case DeathCause::hit_opponent:
            return "hit_opponent";
    }
    return "none";
}

} // namespace s2d::game
