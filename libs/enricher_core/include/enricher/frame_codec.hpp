// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file frame_codec.hpp
/// @brief Varint length-prefixed framing for delivery stream payloads
///
/// A payload is a concatenation of frames:
///
///   varint32(length) || length bytes of message
///
/// The frames must consume the payload exactly. This is the same layout
/// protobuf uses for delimited messages, so the varint primitives come from
/// google::protobuf::io.

#include <cstdint>
#include <vector>

namespace enricher {

/// One message body, without its length prefix
using Frame = std::vector<uint8_t>;

/// Split a payload into its frames
/// @param buffer Concatenated frames
/// @return Frames in stream order (empty for an empty buffer)
/// @throws FramingError on a truncated prefix, a length that runs past the
///         end of the buffer, or any trailing bytes
std::vector<Frame> decode_stream(const std::vector<uint8_t>& buffer);

/// Join frames into a payload, prefixing each with its varint32 length
/// @throws FramingError if a frame is too large for a varint32 prefix
std::vector<uint8_t> encode_stream(const std::vector<Frame>& frames);

}  // namespace enricher
