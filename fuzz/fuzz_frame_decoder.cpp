// Fuzz target for frame reassembly and payload decoding
// Feeds arbitrary bytes to FrameDecoder in fuzzer-chosen chunk sizes, then
// decodes every completed frame in both encodings
//
// The frame decoder sits directly on the network. Bugs can cause:
// - Out-of-bounds reads (header parsed from a short buffer)
// - Memory exhaustion (trusting an announced length)
// - Lost or duplicated bytes when frames straddle reads
//
// Target code:
// - src/network/message.cpp (FrameDecoder, decode_body)

#include "errors.hpp"
#include "network/message.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

using namespace skiff;
using namespace skiff::network;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 1) {
        return 0;
    }

    // First byte picks the chunk size
    const size_t chunk = static_cast<size_t>(data[0]) + 1;
    data++;
    size--;

    FrameDecoder decoder;
    std::vector<Frame> frames;
    size_t consumed = 0;
    try {
        for (size_t offset = 0; offset < size; offset += chunk) {
            const size_t n = std::min(chunk, size - offset);
            auto done = decoder.feed(data + offset, n);
            frames.insert(frames.end(), done.begin(), done.end());
            consumed += n;
        }
    } catch (const CodecError&) {
        // Oversized header: the decoder must refuse further input
        bool refused = false;
        try {
            decoder.feed(data, 0);
        } catch (const CodecError&) {
            refused = true;
        }
        if (!refused) {
            __builtin_trap();
        }
        return 0;
    }

    // Every byte is either in a completed frame or still buffered
    size_t accounted = decoder.buffered();
    for (const auto& frame : frames) {
        if (frame.payload.size() > MAX_PAYLOAD_SIZE) {
            __builtin_trap();
        }
        accounted += FRAME_HEADER_SIZE + frame.payload.size();
    }
    if (accounted != consumed) {
        __builtin_trap();
    }

    for (const auto& frame : frames) {
        for (Encoding encoding : {Encoding::Binary, Encoding::Text}) {
            try {
                nlohmann::json body = decode_body(frame.payload.data(), frame.payload.size(), encoding);
                // Anything decoded must encode again in text form
                (void)encode_body(body, Encoding::Text);
            } catch (const CodecError&) {
                // Malformed payloads are expected
            }
        }
    }
    return 0;
}
