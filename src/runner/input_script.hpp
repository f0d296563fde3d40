// SPDX-License-Identifier: Apache-2.0
// input_script.hpp - scripted held-key timeline replacing the keyboard for headless runs
#pragma once
#include "game/match.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace s2d::runner {

struct InputSpan
{
    uint32_t player{1}; // 1 or 2
    uint64_t from{1};
    uint64_t to{std::numeric_limits<uint64_t>::max()}; // inclusive
    bool left{false};
    bool right{false};
    bool fire{false};
};

class InputScript
{
public:
    InputScript() = default;
    explicit InputScript(std::vector<InputSpan> spans);

    // Held keys for both slots at `tick`; overlapping spans are OR-ed.
    game::PlayerInputs sample(uint64_t tick) const;

    const std::vector<InputSpan> &spans() const { return spans_; }
    bool empty() const { return spans_.empty(); }

private:
    std::vector<InputSpan> spans_;
};

// Expects a sequence of span maps, optionally under a top-level `spans:` key.
// Throws YAML::Exception on malformed YAML, std::invalid_argument on a bad player or range.
InputScript parse_input_script(const YAML::Node &root);
InputScript load_input_script(const std::string &path);

} // namespace s2d::runner
