// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file message_codec.hpp
/// @brief Protobuf (de)serialization of OTLP v0.7.0 export requests
///
/// Thin wrapper over the generated ExportMetricsServiceRequest that turns
/// protobuf's bool results into typed exceptions, plus helpers that compose
/// the message codec with the frame codec for a whole record payload.

#include "enricher/frame_codec.hpp"

#include "opentelemetry/proto/collector/metrics/v1/metrics_service.pb.h"
#include "opentelemetry/proto/metrics/v1/metrics.pb.h"

#include <cstdint>
#include <vector>

namespace enricher {

/// @name Schema aliases
/// @{
using ExportRequest = opentelemetry::proto::collector::metrics::v1::ExportMetricsServiceRequest;
using ResourceMetrics = opentelemetry::proto::metrics::v1::ResourceMetrics;
using ScopeMetrics = opentelemetry::proto::metrics::v1::InstrumentationLibraryMetrics;
using Metric = opentelemetry::proto::metrics::v1::Metric;
using Label = opentelemetry::proto::common::v1::StringKeyValue;
/// @}

/// Decode one frame into an export request
/// @throws SchemaDecodeError if protobuf rejects the bytes
ExportRequest decode_request(const Frame& frame);

/// Serialize an export request
/// @throws SchemaEncodeError if protobuf serialization fails
Frame encode_request(const ExportRequest& request);

/// Decode every frame of a payload
/// @throws FramingError, SchemaDecodeError
std::vector<ExportRequest> decode_batch(const std::vector<uint8_t>& payload);

/// Encode and frame a sequence of requests
/// @throws SchemaEncodeError, FramingError
std::vector<uint8_t> encode_batch(const std::vector<ExportRequest>& requests);

}  // namespace enricher
