// SPDX-License-Identifier: Apache-2.0
// projectiles.hpp - duo-mode ballistic projectiles: cooldown-gated firing, lifetime, owner-exclusive hits
#pragma once
#include "game/events.hpp"
#include "game/match_state.hpp"

namespace s2d::game {

// Spawns a projectile at the shooter's head along its angle unless the cooldown is still running.
// Returns false (and changes nothing) while state.tick < shooter.shoot_cooldown_until_tick.
bool try_fire(MatchState &state, Snake &shooter, TickOutput &out);

// Drops projectiles older than the lifetime, then moves the rest by their velocity and wraps them.
void advance_projectiles(MatchState &state, TickOutput &out);

// Consumes every projectile within the hit radius (plain distance) of a live non-owner head and slows that
// snake until now + slow duration. An earlier slow expiry is overwritten, not extended.
void resolve_projectile_hits(MatchState &state, TickOutput &out);

} // namespace s2d::game
