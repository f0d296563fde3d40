// SPDX-License-Identifier: Apache-2.0
// Length-prefixed record framing: 4-byte big-endian payload length followed by the payload bytes.
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace s2d::framing {

inline constexpr uint32_t kMaxFrameBytes = 16u * 1024u * 1024u;

inline std::string build_frame(const std::string &payload)
{
    uint32_t len = static_cast<uint32_t>(payload.size());
    uint32_t net = htonl(len);
    std::string frame;
    frame.resize(4 + payload.size());
    std::memcpy(frame.data(), &net, 4);
    std::memcpy(frame.data() + 4, payload.data(), payload.size());
    return frame;
}

enum class extract_status
{
    need_more,
    frame,
    invalid // declared length is zero or above kMaxFrameBytes; the stream cannot be resynchronised
};

struct FrameParseState
{
    std::vector<char> buffer; // accumulated bytes
    uint32_t expected_len{0};
    bool have_len{false};

    void feed(const char *data, size_t n) { buffer.insert(buffer.end(), data, data + n); }
};

inline extract_status try_extract(FrameParseState &st, std::string &out)
{
    if (!st.have_len) {
        if (st.buffer.size() < 4)
            return extract_status::need_more;
        uint32_t net;
        std::memcpy(&net, st.buffer.data(), 4);
        st.expected_len = ntohl(net);
        if (st.expected_len == 0 || st.expected_len > kMaxFrameBytes)
            return extract_status::invalid;
        st.have_len = true;
    }
    if (st.buffer.size() < 4 + static_cast<size_t>(st.expected_len))
        return extract_status::need_more;
    out.assign(st.buffer.data() + 4, st.expected_len);
    st.buffer.erase(st.buffer.begin(), st.buffer.begin() + 4 + st.expected_len);
    st.have_len = false;
    st.expected_len = 0;
    return extract_status::frame;
}

} // namespace s2d::framing
