// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file firehose_event.hpp
/// @brief Data transformation event / response JSON for delivery streams
///
/// Event:
/// @code
///   {"invocationId": "...", "deliveryStreamArn": "...", "region": "...",
///    "records": [{"recordId": "...", "data": "<base64>"}, ...]}
/// @endcode
/// Response:
/// @code
///   {"records": [{"recordId": "...", "result": "Ok", "data": "<base64>"}, ...]}
/// @endcode

#include "enricher/record_pipeline.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace enricher {

/// Decoded transformation event
struct FirehoseEvent {
    std::string invocation_id;
    std::string delivery_stream_arn;
    std::string region;
    std::vector<InputRecord> records;
};

/// Parse an event from a JSON document
/// @throws EventFormatError if the JSON is malformed, "records" is missing
///         or not an array, or a record lacks string recordId/data
FirehoseEvent parse_firehose_event(const nlohmann::json& j);

/// Parse an event from JSON text
/// @throws EventFormatError
FirehoseEvent parse_firehose_event(const std::string& json_text);

/// Build the response document
nlohmann::json to_response_json(const std::vector<OutputRecord>& outputs);

/// Serialize the response document
/// @param indent -1 for compact output
std::string serialize_firehose_response(const std::vector<OutputRecord>& outputs,
                                        int indent = -1);

}  // namespace enricher
