// SPDX-License-Identifier: Apache-2.0
// unit_input_script.cpp
// Held-key spans: inclusive ranges, open-ended spans, OR-ing of overlaps and rejection of bad spans.
#include "runner/input_script.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace s2d::runner;

int main()
{
    auto script = parse_input_script(YAML::Load(
        "spans:\n"
        "  - {player: 1, from: 10, to: 20, left: true}\n"
        "  - {player: 1, from: 15, to: 30, fire: true}\n"
        "  - {player: 2, from: 5, right: true}\n"));
    assert(script.spans().size() == 3);

    auto in = script.sample(9);
    assert(!in[0].turn_left && !in[0].fire && in[1].turn_right);
    in = script.sample(10);
    assert(in[0].turn_left && !in[0].fire);
    in = script.sample(15);
    assert(in[0].turn_left && in[0].fire && !in[0].turn_right);
    in = script.sample(20);
    assert(in[0].turn_left && in[0].fire);
    in = script.sample(21);
    assert(!in[0].turn_left && in[0].fire);
    in = script.sample(31);
    assert(!in[0].turn_left && !in[0].fire);
    // No `to`: held forever.
    assert(script.sample(4)[1].turn_right == false);
    assert(script.sample(1000000)[1].turn_right);

    // A bare sequence works too; keys default to released.
    auto bare = parse_input_script(YAML::Load("- {player: 2, from: 1, to: 1, fire: true}\n"));
    assert(bare.sample(1)[1].fire && !bare.sample(2)[1].fire);
    assert(!bare.sample(1)[0].fire);

    InputScript empty;
    assert(empty.empty());
    auto idle = empty.sample(5);
    assert(!idle[0].turn_left && !idle[0].turn_right && !idle[0].fire && !idle[1].fire);
    assert(parse_input_script(YAML::Load("spans: []\n")).empty());

    bool threw = false;
    try {
        parse_input_script(YAML::Load("- {player: 3, from: 1}\n"));
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        parse_input_script(YAML::Load("- {player: 1, from: 10, to: 5}\n"));
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        parse_input_script(YAML::Load("spans: {player: 1}\n"));
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);

    // Shipped example script.
    auto shipped = load_input_script(std::string(S2D_TEST_DATA_DIR) + "/duel_inputs.yaml");
    assert(!shipped.empty());
    assert(shipped.sample(1)[0].fire && shipped.sample(1)[1].fire);

    std::cout << "unit_input_script OK" << std::endl;
    return 0;
}
