// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file record_pipeline.hpp
/// @brief Per-record decode -> match -> augment -> encode pipeline
///
/// RecordPipeline is the failure boundary of the enricher. Each record is
/// processed independently:
///
///   base64 -> frames -> ExportRequest[] -> augment -> frames -> base64
///
/// Any exception raised while processing a record is caught, logged with
/// the record id, and turned into a ProcessingFailed result that carries
/// the original payload unchanged. One bad record never affects the rest.
///
/// Example:
/// @code
///   const auto config = enricher::load_config_from_env();
///   enricher::RecordPipeline pipeline(config);
///   auto outputs = pipeline.process_all(event.records);
/// @endcode

#include "enricher/message_codec.hpp"
#include "enricher/summary_metric_factory.hpp"
#include "enricher/transform_config.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace enricher {

/// Result reported back to the delivery stream for one record
enum class RecordResult {
    Ok,
    ProcessingFailed
};

/// Get the delivery stream spelling of a result ("Ok", "ProcessingFailed")
const char* to_string(RecordResult result);

/// Incoming record
struct InputRecord {
    std::string record_id;
    std::string data;   ///< base64 payload
};

/// Outgoing record
struct OutputRecord {
    std::string record_id;
    RecordResult result = RecordResult::Ok;
    std::string data;   ///< base64 payload
};

/// Counters accumulated across process() calls
struct PipelineStats {
    uint64_t records_total = 0;
    uint64_t records_ok = 0;
    uint64_t records_failed = 0;
    uint64_t messages_processed = 0;
    uint64_t metrics_added = 0;
};

class RecordPipeline {
public:
    /// @param config Must outlive the pipeline; never modified
    /// @param clock Timestamp source for synthetic metrics
    explicit RecordPipeline(const TransformConfig& config,
                            SummaryMetricFactory::Clock clock = now_unix_nano_truncated);

    RecordPipeline(const RecordPipeline&) = delete;
    RecordPipeline& operator=(const RecordPipeline&) = delete;

    /// Append synthetic metrics to every scope that references a target
    ///
    /// All scopes are scanned before anything is appended, so synthetic
    /// metrics are never rescanned. Does nothing when the configuration is
    /// incomplete.
    /// @return Number of metrics appended
    size_t augment(ExportRequest& request);

    /// Transform a raw (already base64-decoded) payload
    /// @throws FramingError, SchemaDecodeError, SchemaEncodeError
    std::vector<uint8_t> transform_payload(const std::vector<uint8_t>& payload);

    /// Process one record; never throws for payload problems
    OutputRecord process(const InputRecord& record);

    /// Process records in order; output has the same order and count
    std::vector<OutputRecord> process_all(const std::vector<InputRecord>& records);

    /// Get accumulated statistics
    const PipelineStats& stats() const { return stats_; }

private:
    const TransformConfig& config_;
    SummaryMetricFactory factory_;
    bool warned_incomplete_ = false;
    PipelineStats stats_;
};

}  // namespace enricher
