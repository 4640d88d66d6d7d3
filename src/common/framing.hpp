// SPDX-License-Identifier: Apache-2.0
// Length-prefixed framing for event logs: 4-byte big-endian payload length followed by the
// serialized record. The same frames can be streamed to a live viewer unchanged.
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace dball::wire {

inline constexpr uint32_t kMaxFrameBytes = 10'000'000;
inline constexpr size_t kFrameHeaderBytes = 4;

inline std::string build_frame(std::string_view payload)
{
    const uint32_t net = htonl(static_cast<uint32_t>(payload.size()));
    std::string frame(kFrameHeaderBytes + payload.size(), '\0');
    std::memcpy(frame.data(), &net, kFrameHeaderBytes);
    if (!payload.empty())
        std::memcpy(frame.data() + kFrameHeaderBytes, payload.data(), payload.size());
    return frame;
}

enum class FrameStatus
{
    Ok,
    NeedMore,
    Corrupt
};

// Incremental parser input. Bytes before `offset` are consumed; they are compacted away on the
// next append so long logs parse in linear time.
struct FrameParseState
{
    std::vector<char> buffer;
    size_t offset{0};
    bool corrupt{false}; // sticky once a length prefix exceeds kMaxFrameBytes

    size_t pending() const noexcept { return buffer.size() - offset; }

    void append(const char *data, size_t n)
    {
        if (offset > 0) {
            buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(offset));
            offset = 0;
        }
        buffer.insert(buffer.end(), data, data + n);
    }
};

// Declared length of the next frame, if its header is complete.
inline bool peek_frame_length(const FrameParseState &st, uint32_t &len)
{
    if (st.pending() < kFrameHeaderBytes)
        return false;
    uint32_t net;
    std::memcpy(&net, st.buffer.data() + st.offset, kFrameHeaderBytes);
    len = ntohl(net);
    return true;
}

// Empty payloads are legal (an empty protobuf message serializes to zero bytes).
inline FrameStatus next_frame(FrameParseState &st, std::string &out)
{
    if (st.corrupt)
        return FrameStatus::Corrupt;
    uint32_t len = 0;
    if (!peek_frame_length(st, len))
        return FrameStatus::NeedMore;
    if (len > kMaxFrameBytes) {
        st.corrupt = true;
        return FrameStatus::Corrupt;
    }
    if (st.pending() < kFrameHeaderBytes + len)
        return FrameStatus::NeedMore;
    out.assign(st.buffer.data() + st.offset + kFrameHeaderBytes, len);
    st.offset += kFrameHeaderBytes + len;
    if (st.offset == st.buffer.size()) {
        st.buffer.clear();
        st.offset = 0;
    }
    return FrameStatus::Ok;
}

inline bool try_extract(FrameParseState &st, std::string &out)
{
    return next_frame(st, out) == FrameStatus::Ok;
}

} // namespace dball::wire
