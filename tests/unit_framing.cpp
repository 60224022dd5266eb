// SPDX-License-Identifier: Apache-2.0
// Basic unit test for framing parser.
#include "common/framing.hpp"

#include <cassert>
#include <iostream>
#include <string>

int main()
{
    using namespace blob::netutil;
    std::string p1 = "hello";
    std::string p2 = std::string(100, 'x');
    auto f1 = build_frame(p1);
    auto f2 = build_frame(p2);
    assert(f1.size() == 4 + p1.size());
    // Big-endian length prefix.
    assert(f1[0] == 0 && f1[1] == 0 && f1[2] == 0 && f1[3] == 5);

    // Feed the first half of two back-to-back frames.
    FrameParseState st;
    std::string all = f1 + f2;
    size_t half = all.size() / 2;
    st.buffer.insert(st.buffer.end(), all.data(), all.data() + half);
    std::string out;
    bool got = try_extract(st, out);
    if (half >= f1.size()) {
        assert(got);
        assert(out == p1);
    } else {
        assert(!got);
    }
    st.buffer.insert(st.buffer.end(), all.data() + half, all.data() + all.size());
    if (!got) {
        bool got_now = try_extract(st, out);
        assert(got_now && out == p1);
    }
    std::string out2;
    bool got2 = try_extract(st, out2);
    assert(got2 && out2 == p2);
    assert(st.buffer.empty());
    assert(!try_extract(st, out2));

    // append_frame batches several frames into one buffer.
    std::string batch;
    append_frame(batch, p1);
    append_frame(batch, p2);
    assert(batch == all);

    // A bad length poisons the stream for good, even if valid bytes follow.
    {
        FrameParseState bad;
        std::string prefix("\x00\x00\x00\x00", 4);
        bad.buffer.insert(bad.buffer.end(), prefix.begin(), prefix.end());
        bad.buffer.insert(bad.buffer.end(), f1.begin(), f1.end());
        assert(!try_extract(bad, out));
        assert(bad.corrupt);
        assert(!try_extract(bad, out));
    }
    std::cout << "unit_framing OK" << std::endl;
    return 0;
}
