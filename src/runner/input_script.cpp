// SPDX-License-Identifier: Apache-2.0
#include "runner/input_script.hpp"

#include "common/logger.hpp"

#include <stdexcept>
#include <utility>

namespace s2d::runner {

InputScript::InputScript(std::vector<InputSpan> spans)
    : spans_(std::move(spans))
{}

game::PlayerInputs InputScript::sample(uint64_t tick) const
{
    game::PlayerInputs in{};
    for (auto &sp : spans_) {
        if (tick < sp.from || tick > sp.to)
            continue;
        auto &slot = in[sp.player - 1];
        slot.turn_left = slot.turn_left || sp.left;
        slot.turn_right = slot.turn_right || sp.right;
        slot.fire = slot.fire || sp.fire;
    }
    return in;
}

InputScript parse_input_script(const YAML::Node &root)
{
    YAML::Node list = root.IsMap() && root["spans"] ? root["spans"] : root;
    std::vector<InputSpan> spans;
    if (!list || list.IsNull())
        return InputScript{};
    if (!list.IsSequence())
        throw std::invalid_argument("input script: expected a sequence of spans");
    for (const auto &n : list) {
        InputSpan sp;
        if (n["player"])
            sp.player = n["player"].as<uint32_t>();
        if (n["from"])
            sp.from = n["from"].as<uint64_t>();
        if (n["to"])
            sp.to = n["to"].as<uint64_t>();
        if (n["left"])
            sp.left = n["left"].as<bool>();
        if (n["right"])
            sp.right = n["right"].as<bool>();
        if (n["fire"])
            sp.fire = n["fire"].as<bool>();
        if (sp.player < 1 || sp.player > 2)
            throw std::invalid_argument("input script: player must be 1 or 2");
        if (sp.to < sp.from)
            throw std::invalid_argument("input script: span ends before it starts");
        spans.push_back(sp);
    }
    log::debug("[input] loaded {} spans", spans.size());
    return InputScript{std::move(spans)};
}

InputScript load_input_script(const std::string &path)
{
    return parse_input_script(YAML::LoadFile(path));
}

} // namespace s2d::runner
