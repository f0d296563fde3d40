// SPDX-License-Identifier: Apache-2.0
// replay.hpp - length-prefixed protobuf replay stream (one ReplayHeader per match, then one TickRecord per tick)
#pragma once
#include "common/framing.hpp"
#include "game.pb.h"
#include "game/events.hpp"
#include "game/match.hpp"

#include <cstdint>
#include <istream>
#include <ostream>

namespace s2d::runner {

inline constexpr uint32_t kReplayFormatVersion = 1;

::s2d::ReplayHeader make_header(const game::MatchConfig &cfg, uint32_t match_index);
// Read-only view of the state; never mutates the match.
void fill_snapshot(const game::MatchState &state, ::s2d::Snapshot *snap);
void fill_event(const game::Event &ev, ::s2d::GameEvent *out);
::s2d::TickRecord make_tick_record(
    const game::MatchState &state, const game::PlayerInputs &inputs, const game::TickOutput &out);

class ReplayWriter
{
public:
    explicit ReplayWriter(std::ostream &out)
        : out_(out)
    {}

    // Both throw std::runtime_error when serialization or the underlying stream fails.
    void write_header(const ::s2d::ReplayHeader &header);
    void write_tick(const ::s2d::TickRecord &record);

    uint64_t records_written() const { return records_; }
    uint64_t bytes_written() const { return bytes_; }

private:
    void write_record(const ::s2d::ReplayRecord &rec);

    std::ostream &out_;
    std::string scratch_;
    uint64_t records_{0};
    uint64_t bytes_{0};
};

class ReplayReader
{
public:
    explicit ReplayReader(std::istream &in)
        : in_(in)
    {}

    // Returns false at a clean end of stream. Throws std::runtime_error on a truncated stream,
    // an invalid length prefix or a payload that does not parse.
    bool next(::s2d::ReplayRecord &rec);

private:
    std::istream &in_;
    framing::FrameParseState st_;
    std::string payload_;
};

} // namespace s2d::runner
