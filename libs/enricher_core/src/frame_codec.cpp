// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "enricher/frame_codec.hpp"
#include "enricher/errors.hpp"

#include <google/protobuf/io/coded_stream.h>

#include <algorithm>
#include <limits>
#include <string>

namespace enricher {

using google::protobuf::io::CodedInputStream;
using google::protobuf::io::CodedOutputStream;

std::vector<Frame> decode_stream(const std::vector<uint8_t>& buffer) {
    std::vector<Frame> frames;
    if (buffer.empty()) {
        return frames;
    }

    // CodedInputStream addresses the buffer with int offsets
    if (buffer.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw FramingError("Stream of " + std::to_string(buffer.size()) +
                           " bytes exceeds the 2 GiB framing limit");
    }

    const int total = static_cast<int>(buffer.size());
    CodedInputStream input(buffer.data(), total);

    while (input.CurrentPosition() < total) {
        const int prefix_offset = input.CurrentPosition();

        uint32_t length = 0;
        if (!input.ReadVarint32(&length)) {
            throw FramingError("Truncated or malformed length prefix at offset " +
                               std::to_string(prefix_offset));
        }

        const int body_offset = input.CurrentPosition();
        const uint64_t remaining = static_cast<uint64_t>(total - body_offset);
        if (length > remaining) {
            throw FramingError("Frame at offset " + std::to_string(prefix_offset) +
                               " declares " + std::to_string(length) +
                               " bytes but only " + std::to_string(remaining) +
                               " remain");
        }

        frames.emplace_back(buffer.begin() + body_offset,
                            buffer.begin() + body_offset + length);
        input.Skip(static_cast<int>(length));
    }

    return frames;
}

std::vector<uint8_t> encode_stream(const std::vector<Frame>& frames) {
    size_t total = 0;
    for (const auto& frame : frames) {
        if (frame.size() > std::numeric_limits<uint32_t>::max()) {
            throw FramingError("Frame of " + std::to_string(frame.size()) +
                               " bytes does not fit a varint32 length prefix");
        }
        total += CodedOutputStream::VarintSize32(static_cast<uint32_t>(frame.size()));
        total += frame.size();
    }

    std::vector<uint8_t> buffer(total);
    uint8_t* out = buffer.data();
    for (const auto& frame : frames) {
        out = CodedOutputStream::WriteVarint32ToArray(
            static_cast<uint32_t>(frame.size()), out);
        if (!frame.empty()) {
            std::copy(frame.begin(), frame.end(), out);
            out += frame.size();
        }
    }

    return buffer;
}

}  // namespace enricher
