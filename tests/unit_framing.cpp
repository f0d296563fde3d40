// SPDX-License-Identifier: Apache-2.0
// unit_framing.cpp
// Length-prefixed record framing: split delivery, back-to-back frames, invalid prefixes and random chunking.
#include "common/framing.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace s2d::framing;

int main()
{
    std::string p1 = "hello";
    std::string p2 = std::string(100, 'x');
    auto f1 = build_frame(p1);
    auto f2 = build_frame(p2);
    assert(f1.size() == 4 + p1.size());
    assert(f1[0] == 0 && f1[1] == 0 && f1[2] == 0 && f1[3] == 5);

    FrameParseState st;
    std::string all = f1 + f2;
    size_t half = all.size() / 2;
    st.feed(all.data(), half);
    std::string out;
    auto r = try_extract(st, out);
    if (half >= f1.size()) {
        assert(r == extract_status::frame && out == p1);
    } else {
        assert(r == extract_status::need_more);
    }
    st.feed(all.data() + half, all.size() - half);
    if (r != extract_status::frame) {
        assert(try_extract(st, out) == extract_status::frame && out == p1);
    }
    std::string out2;
    assert(try_extract(st, out2) == extract_status::frame && out2 == p2);
    assert(try_extract(st, out2) == extract_status::need_more);
    assert(st.buffer.empty());

    // Zero and oversized lengths cannot be resynchronised.
    FrameParseState zero;
    const char z[4] = {0, 0, 0, 0};
    zero.feed(z, 4);
    assert(try_extract(zero, out) == extract_status::invalid);
    FrameParseState huge;
    const char h[4] = {0x7f, 0, 0, 0};
    huge.feed(h, 4);
    assert(try_extract(huge, out) == extract_status::invalid);

    // Byte-at-a-time and random chunk sizes reassemble the same payloads.
    std::mt19937 rng(12345);
    for (int round = 0; round < 100; ++round) {
        std::string stream;
        std::vector<std::string> payloads;
        for (int i = 0; i < 5; ++i) {
            size_t len = std::uniform_int_distribution<size_t>{1, 512}(rng);
            std::string p(len, '\0');
            for (auto &c : p)
                c = static_cast<char>(std::uniform_int_distribution<int>{0, 255}(rng));
            payloads.push_back(p);
            stream += build_frame(p);
        }
        FrameParseState s;
        std::vector<std::string> got;
        size_t pos = 0;
        while (pos < stream.size()) {
            size_t n = round == 0 ? 1 : std::uniform_int_distribution<size_t>{1, 97}(rng);
            n = std::min(n, stream.size() - pos);
            s.feed(stream.data() + pos, n);
            pos += n;
            std::string frame;
            while (try_extract(s, frame) == extract_status::frame)
                got.push_back(frame);
        }
        assert(got == payloads);
    }

    std::cout << "unit_framing OK" << std::endl;
    return 0;
}
