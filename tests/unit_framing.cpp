// SPDX-License-Identifier: Apache-2.0
// unit_framing.cpp
// Length-prefixed frame parser: split feeds, truncation, oversized lengths, empty payloads.
#include "common/framing.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace dball::wire;

static std::vector<std::string> feed_in_chunks(const std::string &data, size_t chunk)
{
    FrameParseState st;
    std::vector<std::string> got;
    std::string out;
    for (size_t i = 0; i < data.size();) {
        size_t n = std::min(chunk, data.size() - i);
        st.append(data.data() + i, n);
        i += n;
        while (try_extract(st, out))
            got.push_back(out);
    }
    assert(st.pending() == 0 && !st.corrupt);
    return got;
}

int main()
{
    // Two frames fed in two halves.
    {
        std::string p1 = "hello";
        std::string p2(100, 'x');
        std::string all = build_frame(p1) + build_frame(p2);
        FrameParseState st;
        size_t half = all.size() / 2;
        st.append(all.data(), half);
        std::string out;
        assert(try_extract(st, out) && out == p1);
        assert(next_frame(st, out) == FrameStatus::NeedMore);
        assert(st.offset == 4 + p1.size());
        st.append(all.data() + half, all.size() - half);
        assert(st.offset == 0);
        assert(try_extract(st, out) && out == p2);
        assert(st.pending() == 0 && st.buffer.empty());
    }

    // Random payloads, every chunk size from 1 to 17 bytes.
    {
        std::mt19937 rng(12345);
        std::vector<std::string> payloads;
        std::string stream;
        for (int i = 0; i < 50; ++i) {
            std::string p(std::uniform_int_distribution<size_t>{0, 512}(rng), '\0');
            for (auto &c : p)
                c = static_cast<char>(rng());
            stream += build_frame(p);
            payloads.push_back(std::move(p));
        }
        for (size_t chunk = 1; chunk <= 17; ++chunk)
            assert(feed_in_chunks(stream, chunk) == payloads);
    }

    // Empty payloads are legal frames.
    {
        auto frame = build_frame("");
        assert(frame.size() == 4);
        FrameParseState st;
        st.append(frame.data(), frame.size());
        std::string out = "stale";
        assert(try_extract(st, out) && out.empty());
        assert(st.pending() == 0);
    }

    // Truncated frames never yield output and keep their bytes.
    {
        auto frame = build_frame(std::string(300, 'y'));
        frame.resize(frame.size() - 1);
        FrameParseState st;
        st.append(frame.data(), frame.size());
        std::string out;
        assert(next_frame(st, out) == FrameStatus::NeedMore);
        assert(st.pending() == frame.size());
        uint32_t len = 0;
        assert(peek_frame_length(st, len) && len == 300);

        FrameParseState short_prefix;
        short_prefix.append("\0\0", 2);
        assert(!peek_frame_length(short_prefix, len));
        assert(next_frame(short_prefix, out) == FrameStatus::NeedMore);
    }

    // Oversized length prefixes mark the stream corrupt for good.
    {
        FrameParseState st;
        uint32_t bad = htonl(kMaxFrameBytes + 1);
        st.append(reinterpret_cast<const char *>(&bad), 4);
        std::string out;
        assert(next_frame(st, out) == FrameStatus::Corrupt);
        assert(st.corrupt);
        auto good = build_frame("ok");
        st.append(good.data(), good.size());
        assert(!try_extract(st, out));
    }

    std::cout << "unit_framing OK" << std::endl;
    return 0;
}
