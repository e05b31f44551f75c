// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "enricher/message_codec.hpp"
#include "enricher/errors.hpp"

#include <limits>
#include <string>

namespace enricher {

ExportRequest decode_request(const Frame& frame) {
    if (frame.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw SchemaDecodeError("Message of " + std::to_string(frame.size()) +
                                " bytes is too large to parse");
    }

    ExportRequest request;
    if (!request.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
        throw SchemaDecodeError("Failed to parse ExportMetricsServiceRequest (" +
                                std::to_string(frame.size()) + " bytes)");
    }
    return request;
}

Frame encode_request(const ExportRequest& request) {
    const size_t size = request.ByteSizeLong();
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw SchemaEncodeError("ExportMetricsServiceRequest of " +
                                std::to_string(size) + " bytes is too large to serialize");
    }

    Frame frame(size);
    if (!request.SerializeToArray(frame.data(), static_cast<int>(size))) {
        throw SchemaEncodeError("Failed to serialize ExportMetricsServiceRequest");
    }
    return frame;
}

std::vector<ExportRequest> decode_batch(const std::vector<uint8_t>& payload) {
    auto frames = decode_stream(payload);

    std::vector<ExportRequest> requests;
    requests.reserve(frames.size());
    for (const auto& frame : frames) {
        requests.push_back(decode_request(frame));
    }
    return requests;
}

std::vector<uint8_t> encode_batch(const std::vector<ExportRequest>& requests) {
    std::vector<Frame> frames;
    frames.reserve(requests.size());
    for (const auto& request : requests) {
        frames.push_back(encode_request(request));
    }
    return encode_stream(frames);
}

}  // namespace enricher
